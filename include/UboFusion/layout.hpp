#pragma once

/// @file layout.hpp
/// @brief Compile-time std140 layout of annotated records
///
/// Every tagged field contributes a fixed number of bytes, in declaration order
/// and with no implicit inter-field alignment:
///
/// | tag                    | bytes                                   |
/// |------------------------|-----------------------------------------|
/// | as_vec4                | 16                                      |
/// | as_mat4                | 64                                      |
/// | as_floats<N>           | 4 * N                                   |
/// | as_floats<N, true>     | 4 * N rounded up to a multiple of 16    |
/// | as_vec4_array<N>       | 16 * N                                  |
/// | untagged record field  | size of the nested record               |
///
/// Untagged non-record fields and `exclude`d fields contribute nothing.
///
/// ```cpp
/// struct Particle {
///     Annotated<std::array<float, 4>, options::as_vec4>           position;
///     Annotated<std::array<float, 4>, options::as_vec4>           color;
///     Annotated<std::array<float, 3>, options::as_floats<3, true>> extra;
/// };
/// static_assert(CalculateSize<Particle>() == 48);
/// ```
///
/// `CalculateSize` additionally refuses (at compile time) records in which a
/// vec4-aligned member would start off a 16-byte boundary; see
/// `LayoutIsVec4Aligned`.

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

#include "static_schema.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"

namespace UboFusion {

enum class SlotKind {
    scalar,
    vec2,
    vec3,
    vec4,
    mat2,
    mat3,
    mat4,
    floats,
    vec4_array,
    array
};

constexpr std::string_view slot_kind_to_string(SlotKind k) {
    switch(k) {
    case SlotKind::scalar: return "scalar"; break;
    case SlotKind::vec2: return "vec2"; break;
    case SlotKind::vec3: return "vec3"; break;
    case SlotKind::vec4: return "vec4"; break;
    case SlotKind::mat2: return "mat2"; break;
    case SlotKind::mat3: return "mat3"; break;
    case SlotKind::mat4: return "mat4"; break;
    case SlotKind::floats: return "floats"; break;
    case SlotKind::vec4_array: return "vec4_array"; break;
    case SlotKind::array: return "array"; break;
    }
    return "N/A";
}

enum class SlotSource {
    schema,
    declaration
};

// One entry of a flattened layout, either derived from a record or parsed
// from a uniform block declaration.
struct SlotDescr {
    std::string_view name;
    std::string_view record;      // owning record, or the uniform block name
    SlotKind         kind   = SlotKind::vec4;
    std::size_t      count  = 1;  // floats / array element count
    bool             pad    = false;
    std::size_t      offset = 0;
    std::size_t      size   = 0;
    SlotSource       source = SlotSource::schema;
};

namespace layout {

using static_schema::FieldKind;
using static_schema::field_schema;

namespace detail {

inline constexpr std::size_t vec4_size = 16;
inline constexpr std::size_t mat4_size = 64;
inline constexpr std::size_t float_size = 4;

constexpr std::size_t round_up_16(std::size_t n) {
    return (n + 15) / 16 * 16;
}

constexpr std::size_t floats_size(std::size_t count, bool pad) {
    return pad ? round_up_16(count * float_size) : count * float_size;
}

template<class R>
consteval std::size_t record_size();

template<class R, std::size_t I>
consteval std::size_t field_size() {
    using FS = field_schema<R, I>;
    if constexpr (FS::kind == FieldKind::vec4) {
        return vec4_size;
    } else if constexpr (FS::kind == FieldKind::mat4) {
        return mat4_size;
    } else if constexpr (FS::kind == FieldKind::floats) {
        return floats_size(FS::count, FS::pad);
    } else if constexpr (FS::kind == FieldKind::vec4_array) {
        return vec4_size * FS::count;
    } else if constexpr (FS::kind == FieldKind::nested) {
        return record_size<typename FS::Value>();
    } else {
        return 0;
    }
}

template<class R>
consteval std::size_t record_size() {
    using T = std::remove_cvref_t<R>;
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return (std::size_t{0} + ... + field_size<T, I>());
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

template<class R, std::size_t I>
consteval std::size_t field_offset() {
    return []<std::size_t... J>(std::index_sequence<J...>) {
        return (std::size_t{0} + ... + field_size<R, J>());
    }(std::make_index_sequence<I>{});
}


template<class R>
consteval bool record_aligned();

template<class R, std::size_t I>
consteval bool field_aligned() {
    using FS = field_schema<R, I>;
    constexpr bool starts_aligned = field_offset<R, I>() % 16 == 0;
    if constexpr (FS::kind == FieldKind::vec4
                  || FS::kind == FieldKind::mat4
                  || FS::kind == FieldKind::vec4_array) {
        return starts_aligned;
    } else if constexpr (FS::kind == FieldKind::floats) {
        return !FS::pad || starts_aligned;
    } else if constexpr (FS::kind == FieldKind::nested) {
        return starts_aligned
            && record_aligned<typename FS::Value>()
            && record_size<typename FS::Value>() % 16 == 0;
    } else {
        return true;
    }
}

template<class R>
consteval bool record_aligned() {
    using T = std::remove_cvref_t<R>;
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return (true && ... && field_aligned<T, I>());
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}


template<class R>
consteval std::size_t slot_count();

template<class R, std::size_t I>
consteval std::size_t field_slot_count() {
    using FS = field_schema<R, I>;
    if constexpr (FS::kind == FieldKind::nested) {
        return slot_count<typename FS::Value>();
    } else if constexpr (FS::kind == FieldKind::inert) {
        return 0;
    } else {
        return 1;
    }
}

template<class R>
consteval std::size_t slot_count() {
    using T = std::remove_cvref_t<R>;
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return (std::size_t{0} + ... + field_slot_count<T, I>());
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

} // namespace detail
} // namespace layout


/// Name of the GLSL uniform block mirrored by T: its block<> option, or the
/// compiler's spelling of the type.
template<class T>
constexpr std::string_view BlockName() {
    using Opts = options::detail::record_opts_getter<std::remove_cvref_t<T>>;
    if constexpr (Opts::template has_option<options::detail::block_tag>) {
        return Opts::template get_option<options::detail::block_tag>::desc.toStringView();
    } else {
        return introspection::typeName<T>;
    }
}

/// True when every vec4, mat4, vec4 array, padded float run and nested record
/// of T starts on a 16-byte boundary, and every nested record spans a multiple
/// of 16 bytes. Unpadded float runs may sit anywhere.
template<class T>
constexpr bool LayoutIsVec4Aligned() {
    return layout::detail::record_aligned<T>();
}

template<class T>
constexpr std::size_t CalculateSize() {
    static_assert(static_schema::Record<T>, "[[[ UboFusion ]]] CalculateSize needs an aggregate or StructMeta-described record");
    static_assert(LayoutIsVec4Aligned<T>(),
                  "[[[ UboFusion ]]] A vec4-aligned field or nested record starts off a 16-byte boundary; pad the preceding float run with as_floats<N, true>");
    return layout::detail::record_size<T>();
}


namespace layout::detail {

template<class R>
constexpr void append_slots(SlotDescr * out, std::size_t & n, std::size_t base) {
    using T = std::remove_cvref_t<R>;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        ([&] {
            using FS = field_schema<T, I>;
            constexpr std::size_t offset = field_offset<T, I>();
            if constexpr (FS::kind == FieldKind::nested) {
                append_slots<typename FS::Value>(out, n, base + offset);
            } else if constexpr (FS::kind != FieldKind::inert) {
                SlotDescr & s = out[n++];
                s.name   = FS::name;
                s.record = BlockName<T>();
                s.count  = FS::count;
                s.pad    = FS::pad;
                s.offset = base + offset;
                s.size   = field_size<T, I>();
                s.source = SlotSource::schema;
                if constexpr (FS::kind == FieldKind::vec4) {
                    s.kind = SlotKind::vec4;
                } else if constexpr (FS::kind == FieldKind::mat4) {
                    s.kind = SlotKind::mat4;
                } else if constexpr (FS::kind == FieldKind::floats) {
                    s.kind = SlotKind::floats;
                } else {
                    s.kind = SlotKind::vec4_array;
                }
            }
        }(), ...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

} // namespace layout::detail

/// Flattened, ordered slots of T (nested records expanded in place) with
/// absolute byte offsets.
template<class T>
constexpr std::array<SlotDescr, layout::detail::slot_count<T>()> SchemaSlots() {
    std::array<SlotDescr, layout::detail::slot_count<T>()> slots{};
    std::size_t n = 0;
    layout::detail::append_slots<T>(slots.data(), n, 0);
    return slots;
}

} // namespace UboFusion
