#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include "struct_introspection.hpp"
#include "static_schema.hpp"
#include "options.hpp"
#include "layout.hpp"
#include "path.hpp"
#include "errors.hpp"
#include "writer_concept.hpp"

namespace UboFusion {

template <std::size_t SchemaDepth>
class WriteResult {
    WriteError m_error = WriteError::NO_ERROR;
    std::string_view m_record;
    path::Path<SchemaDepth> m_path;
    std::size_t m_expected = 0;
    std::size_t m_actual = 0;
    std::size_t m_written = 0;
public:
    constexpr WriteResult(WriteError err, std::string_view record, const path::Path<SchemaDepth> & p,
                          std::size_t expected, std::size_t actual, std::size_t written):
        m_error(err), m_record(record), m_path(p), m_expected(expected), m_actual(actual), m_written(written)
    {}
    constexpr operator bool() const {
        return m_error == WriteError::NO_ERROR;
    }
    constexpr WriteError error() const {
        return m_error;
    }
    // Record owning the failing field
    constexpr std::string_view record() const {
        return m_record;
    }
    constexpr const path::Path<SchemaDepth> & errorPath() const {
        return m_path;
    }
    // Count the field needs (components, elements or bytes) vs. what it got
    constexpr std::size_t expected() const {
        return m_expected;
    }
    constexpr std::size_t actual() const {
        return m_actual;
    }
    constexpr std::size_t bytesWritten() const {
        return m_written;
    }
};


namespace writer_details {

using namespace static_schema;

template <std::size_t SchemaDepth, writer::ByteSinkLike Sink>
class WriteContext {
    WriteError m_error = WriteError::NO_ERROR;
    std::size_t m_expected = 0;
    std::size_t m_actual = 0;
    std::size_t m_start;
public:
    Sink & sink;
    path::Path<SchemaDepth> currentPath;
    std::string_view record;

    constexpr WriteContext(Sink & s, std::string_view rootRecord):
        m_start(s.written()), sink(s), record(rootRecord) {}

    constexpr bool withError(WriteError err, std::size_t expected = 0, std::size_t actual = 0) {
        m_error = err;
        m_expected = expected;
        m_actual = actual;
        return false;
    }
    constexpr bool withSinkError() {
        return withError(WriteError::SINK_OVERFLOW, sink.capacity(), sink.written());
    }
    constexpr std::size_t written() const {
        return sink.written() - m_start;
    }
    constexpr WriteResult<SchemaDepth> result() const {
        return WriteResult<SchemaDepth>(m_error, record, currentPath, m_expected, m_actual, written());
    }
};


template <class V, class CTX>
    requires Vec4Value<V>
constexpr bool WriteVec4(const V & v, CTX & ctx) {
    using NT = numbers_traits<V>;
    if constexpr (NT::extent == dynamic_extent) {
        if(const std::size_t n = NT::size(v); n != 4) {
            return ctx.withError(WriteError::WRONG_COMPONENT_COUNT, 4, n);
        }
    }
    for(std::size_t i = 0; i < 4; i ++) {
        if(!writer::put_float(ctx.sink, NT::number(v, i))) return ctx.withSinkError();
    }
    return true;
}

template <class V, class CTX>
    requires Nullable<V>
constexpr bool WriteVec4(const V & v, CTX & ctx) {
    using NT = nullable_traits<V>;
    if(!NT::has_value(v)) {
        if(!writer::put_zeros(ctx.sink, layout::detail::vec4_size)) return ctx.withSinkError();
        return true;
    }
    return WriteVec4(NT::get(v), ctx);
}


template <class CTX>
constexpr bool WriteIdentity(CTX & ctx) {
    for(std::size_t col = 0; col < 4; col ++) {
        for(std::size_t row = 0; row < 4; row ++) {
            if(!writer::put_float(ctx.sink, col == row ? 1.0f : 0.0f)) return ctx.withSinkError();
        }
    }
    return true;
}

template <class V, class CTX>
constexpr bool WriteMat4(const V & v, CTX & ctx) {
    if constexpr (Nullable<V>) {
        using NT = nullable_traits<V>;
        if(!NT::has_value(v)) {
            return WriteIdentity(ctx);
        }
        return WriteMat4(NT::get(v), ctx);
    } else if constexpr (Mat4FlatValue<V>) {
        using NT = numbers_traits<V>;
        if constexpr (NT::extent == dynamic_extent) {
            if(const std::size_t n = NT::size(v); n != 16) {
                return ctx.withError(WriteError::WRONG_COMPONENT_COUNT, 16, n);
            }
        }
        // already column-major
        for(std::size_t i = 0; i < 16; i ++) {
            if(!writer::put_float(ctx.sink, NT::number(v, i))) return ctx.withSinkError();
        }
        return true;
    } else {
        using ST = sequence_traits<V>;
        if constexpr (ST::extent == dynamic_extent) {
            if(const std::size_t n = ST::size(v); n != 4) {
                return ctx.withError(WriteError::WRONG_COMPONENT_COUNT, 4, n);
            }
        }
        for(std::size_t col = 0; col < 4; col ++) {
            if(!WriteVec4(ST::at(v, col), ctx)) return false;
        }
        return true;
    }
}


template <std::size_t Count, bool Pad, class V, class CTX>
constexpr bool WriteFloats(const V & v, CTX & ctx) {
    if constexpr (Nullable<V>) {
        using NT = nullable_traits<V>;
        if(!NT::has_value(v)) {
            return ctx.withError(WriteError::MISSING_VALUE, Count, 0);
        }
        return WriteFloats<Count, Pad>(NT::get(v), ctx);
    } else {
        if constexpr (Scalar<V>) {
            if(!writer::put_float(ctx.sink, static_cast<float>(v))) return ctx.withSinkError();
        } else {
            using NT = numbers_traits<V>;
            if constexpr (NT::extent == dynamic_extent) {
                if(const std::size_t n = NT::size(v); n < Count) {
                    return ctx.withError(WriteError::TOO_FEW_ELEMENTS, Count, n);
                }
            }
            // extra elements are ignored
            for(std::size_t i = 0; i < Count; i ++) {
                if(!writer::put_float(ctx.sink, NT::number(v, i))) return ctx.withSinkError();
            }
        }
        constexpr std::size_t padding = layout::detail::floats_size(Count, Pad) - Count * layout::detail::float_size;
        if(!writer::put_zeros(ctx.sink, padding)) return ctx.withSinkError();
        return true;
    }
}


template <std::size_t Count, class V, class CTX>
constexpr bool WriteVec4Array(const V & v, CTX & ctx) {
    if constexpr (Nullable<V>) {
        using NT = nullable_traits<V>;
        if(!NT::has_value(v)) {
            if(!writer::put_zeros(ctx.sink, Count * layout::detail::vec4_size)) return ctx.withSinkError();
            return true;
        }
        return WriteVec4Array<Count>(NT::get(v), ctx);
    } else {
        using ST = sequence_traits<V>;
        const std::size_t n = ST::size(v);
        if constexpr (ST::extent == dynamic_extent) {
            if(n > Count) {
                return ctx.withError(WriteError::TOO_MANY_ELEMENTS, Count, n);
            }
        }
        for(std::size_t i = 0; i < n; i ++) {
            ctx.currentPath.push_index(i);
            if(!WriteVec4(ST::at(v, i), ctx)) return false;
            ctx.currentPath.pop();
        }
        if(!writer::put_zeros(ctx.sink, (Count - n) * layout::detail::vec4_size)) return ctx.withSinkError();
        return true;
    }
}


template <class R, class CTX>
constexpr bool WriteRecord(const R & obj, CTX & ctx);

template <std::size_t StructIndex, class R, class CTX>
constexpr bool WriteOneField(const R & obj, CTX & ctx) {
    using FS   = field_schema<R, StructIndex>;
    using Meta = options::detail::annotation_meta_getter<typename FS::Element>;

    if constexpr (FS::kind == FieldKind::inert) {
        return true;
    } else {
        const auto & value = Meta::getRef(introspection::getStructElementByIndex<StructIndex>(obj));
        ctx.currentPath.push_field(FS::name);
        bool ok = false;
        if constexpr (FS::kind == FieldKind::vec4) {
            ok = WriteVec4(value, ctx);
        } else if constexpr (FS::kind == FieldKind::mat4) {
            ok = WriteMat4(value, ctx);
        } else if constexpr (FS::kind == FieldKind::floats) {
            ok = WriteFloats<FS::count, FS::pad>(value, ctx);
        } else if constexpr (FS::kind == FieldKind::vec4_array) {
            ok = WriteVec4Array<FS::count>(value, ctx);
        } else {
            const std::string_view outer = ctx.record;
            ctx.record = BlockName<typename FS::Value>();
            ok = WriteRecord(value, ctx);
            if(ok) ctx.record = outer;
        }
        if(!ok) return false;   // path and record stay at the failing field
        ctx.currentPath.pop();
        return true;
    }
}

template <class R, class CTX>
constexpr bool WriteRecord(const R & obj, CTX & ctx) {
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (WriteOneField<I>(obj, ctx) && ...);
    }(std::make_index_sequence<introspection::structureElementsCount<R>>{});
}

} // namespace writer_details


/// Packs obj into sink: exactly CalculateSize<T>() bytes in declaration order.
/// Fails up front when the sink cannot take the whole record; after a failed
/// write the sink content is unspecified and must be discarded.
template <static_schema::Record T, writer::ByteSinkLike Sink>
constexpr WriteResult<static_schema::record_depth<T>()> Write(const T & obj, Sink & sink) {
    constexpr std::size_t Depth = static_schema::record_depth<T>();
    constexpr std::size_t Size = CalculateSize<T>();

    writer_details::WriteContext<Depth, Sink> ctx(sink, BlockName<T>());

    if(sink.capacity() != writer::unbounded_capacity) {
        const std::size_t room = sink.capacity() - sink.written();
        if(room < Size) {
            ctx.withError(WriteError::BUFFER_TOO_SMALL, Size, room);
            return ctx.result();
        }
    }

    if(!writer_details::WriteRecord(obj, ctx)) {
        return ctx.result();
    }

    if(ctx.written() != Size) {
        ctx.withError(WriteError::LAYOUT_DRIFT, Size, ctx.written());
    }
    return ctx.result();
}

/// Packs obj into the front of a caller-owned buffer.
template <static_schema::Record T>
constexpr WriteResult<static_schema::record_depth<T>()> Write(const T & obj, std::span<std::byte> buffer) {
    writer::SpanSink sink(buffer);
    return Write(obj, sink);
}

/// Appends the packed bytes of obj to a growable byte container.
template <static_schema::Record T, class C>
    requires (!writer::ByteSinkLike<C>
              && requires (C & c, std::byte b) { c.push_back(static_cast<typename C::value_type>(b)); c.size(); })
constexpr WriteResult<static_schema::record_depth<T>()> Write(const T & obj, C & container) {
    writer::ContainerSink<C> sink(container);
    return Write(obj, sink);
}

} // namespace UboFusion
