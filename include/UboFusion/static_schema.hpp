#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <utility>

#include <pfr/core.hpp>
#include <pfr/tuple_size.hpp>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace UboFusion {

namespace static_schema {

inline constexpr std::size_t dynamic_extent = std::numeric_limits<std::size_t>::max();

namespace input_checks {

template<class T>
struct is_std_array : std::false_type {};

template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T>
constexpr bool is_fixed_array_v = is_std_array<std::remove_cvref_t<T>>::value
                               || std::is_bounded_array_v<std::remove_cvref_t<T>>;

} // namespace input_checks


using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = std::remove_cvref_t<typename annotation_meta_getter<Field>::value_t>;


// bool is not a GPU float source
template<class T>
concept Scalar = std::is_arithmetic_v<std::remove_cvref_t<T>>
              && !std::is_same_v<std::remove_cvref_t<T>, bool>;


template<class T>
struct nullable_traits {
    static constexpr bool is_nullable = false;
};

template<class T>
struct nullable_traits<std::optional<T>> {
    static constexpr bool is_nullable = true;
    using value_type = T;
    static constexpr bool has_value(const std::optional<T> & v) { return v.has_value(); }
    static constexpr const T & get(const std::optional<T> & v) { return *v; }
};

template<class T>
struct nullable_traits<std::unique_ptr<T>> {
    static constexpr bool is_nullable = true;
    using value_type = T;
    static constexpr bool has_value(const std::unique_ptr<T> & v) { return v != nullptr; }
    static constexpr const T & get(const std::unique_ptr<T> & v) { return *v; }
};

template<class T>
struct nullable_traits<std::shared_ptr<T>> {
    static constexpr bool is_nullable = true;
    using value_type = T;
    static constexpr bool has_value(const std::shared_ptr<T> & v) { return v != nullptr; }
    static constexpr const T & get(const std::shared_ptr<T> & v) { return *v; }
};

template<class T>
concept Nullable = nullable_traits<std::remove_cvref_t<T>>::is_nullable;


template<class C>
struct sequence_traits {
    static constexpr bool is_sequence = false;
};

template<class E, std::size_t N>
struct sequence_traits<std::array<E, N>> {
    static constexpr bool is_sequence = true;
    using element_type = E;
    static constexpr std::size_t extent = N;
    static constexpr std::size_t size(const std::array<E, N> &) { return N; }
    static constexpr const E & at(const std::array<E, N> & c, std::size_t i) { return c[i]; }
};

template<class E, std::size_t N>
struct sequence_traits<E[N]> {
    static constexpr bool is_sequence = true;
    using element_type = E;
    static constexpr std::size_t extent = N;
    static constexpr std::size_t size(const E (&)[N]) { return N; }
    static constexpr const E & at(const E (&c)[N], std::size_t i) { return c[i]; }
};

// Run-time sized: std::vector, std::span, ...
template<class C>
    requires (!input_checks::is_fixed_array_v<C>
              && std::ranges::random_access_range<const C>
              && std::ranges::sized_range<const C>)
struct sequence_traits<C> {
    static constexpr bool is_sequence = true;
    using element_type = std::remove_cvref_t<std::ranges::range_reference_t<const C>>;
    static constexpr std::size_t extent = dynamic_extent;
    static constexpr std::size_t size(const C & c) { return static_cast<std::size_t>(std::ranges::size(c)); }
    static constexpr decltype(auto) at(const C & c, std::size_t i) { return std::ranges::begin(c)[i]; }
};

template<class C>
concept Sequence = sequence_traits<std::remove_cvref_t<C>>::is_sequence;


template<class T>
constexpr bool all_members_scalar() {
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return (Scalar<pfr::tuple_element_t<I, T>> && ...);
    }(std::make_index_sequence<pfr::tuple_size_v<T>>{});
}

template<class T>
concept PlainAggregate = std::is_class_v<T>
                      && std::is_aggregate_v<T>
                      && !input_checks::is_fixed_array_v<T>
                      && !std::ranges::range<T>
                      && !Nullable<T>;

// struct { float x, y, z, w; } and the like: components in declaration order
template<class T>
concept NumericAggregate = PlainAggregate<T>
                        && (pfr::tuple_size_v<T> > 0)
                        && all_members_scalar<T>();


// Flat run of numbers: numeric sequences and numeric aggregates.
template<class V>
struct numbers_traits {
    static constexpr bool is_numbers = false;
};

template<class V>
    requires (Sequence<V> && Scalar<typename sequence_traits<V>::element_type>)
struct numbers_traits<V> {
    static constexpr bool is_numbers = true;
    static constexpr std::size_t extent = sequence_traits<V>::extent;
    static constexpr std::size_t size(const V & v) { return sequence_traits<V>::size(v); }
    static constexpr float number(const V & v, std::size_t i) {
        return static_cast<float>(sequence_traits<V>::at(v, i));
    }
};

template<class V>
    requires (!Sequence<V> && NumericAggregate<V>)
struct numbers_traits<V> {
    static constexpr bool is_numbers = true;
    static constexpr std::size_t extent = pfr::tuple_size_v<V>;
    static constexpr std::size_t size(const V &) { return extent; }
    static constexpr float number(const V & v, std::size_t i) {
        float r = 0.0f;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((I == i ? (r = static_cast<float>(pfr::get<I>(v)), true) : false) || ...);
        }(std::make_index_sequence<extent>{});
        return r;
    }
};

template<class V>
concept Numbers = numbers_traits<std::remove_cvref_t<V>>::is_numbers;

template<class V>
constexpr std::size_t numbers_extent = numbers_traits<std::remove_cvref_t<V>>::extent;


template<class V>
concept Vec4Value = Numbers<V>
                 && (numbers_extent<V> == 4 || numbers_extent<V> == dynamic_extent);

template<class V>
concept Vec4Field = Vec4Value<V>
                 || (Nullable<V> && Vec4Value<typename nullable_traits<std::remove_cvref_t<V>>::value_type>);

template<class V>
concept Mat4FlatValue = Numbers<V>
                     && (numbers_extent<V> == 16 || numbers_extent<V> == dynamic_extent);

// Outer index is the column
template<class V>
concept Mat4ColumnsValue = Sequence<V>
                        && !Numbers<V>
                        && Vec4Value<typename sequence_traits<std::remove_cvref_t<V>>::element_type>
                        && (sequence_traits<std::remove_cvref_t<V>>::extent == 4
                            || sequence_traits<std::remove_cvref_t<V>>::extent == dynamic_extent);

template<class V>
concept Mat4Value = Mat4FlatValue<V> || Mat4ColumnsValue<V>;

template<class V>
concept Mat4Field = Mat4Value<V>
                 || (Nullable<V> && Mat4Value<typename nullable_traits<std::remove_cvref_t<V>>::value_type>);

template<class V, std::size_t Count>
concept FloatsValue = (Scalar<V> && Count == 1)
                   || (Numbers<V> && (numbers_extent<V> == dynamic_extent || numbers_extent<V> >= Count));

template<class V, std::size_t Count>
concept FloatsField = FloatsValue<V, Count>
                   || (Nullable<V> && FloatsValue<typename nullable_traits<std::remove_cvref_t<V>>::value_type, Count>);

template<class V, std::size_t Count>
concept Vec4ArrayValue = Sequence<V>
                      && !Numbers<V>
                      && Vec4Field<typename sequence_traits<std::remove_cvref_t<V>>::element_type>
                      && (sequence_traits<std::remove_cvref_t<V>>::extent == dynamic_extent
                          || sequence_traits<std::remove_cvref_t<V>>::extent <= Count);

template<class V, std::size_t Count>
concept Vec4ArrayField = Vec4ArrayValue<V, Count>
                      || (Nullable<V> && Vec4ArrayValue<typename nullable_traits<std::remove_cvref_t<V>>::value_type, Count>);


// Aggregate (PFR) or StructMeta-described type; untagged fields of this kind
// are recursed.
template<class T>
concept Record = introspection::detail::has_struct_meta_specialization<std::remove_cvref_t<T>>
              || PlainAggregate<std::remove_cvref_t<T>>;


enum class FieldKind {
    inert,
    vec4,
    mat4,
    floats,
    vec4_array,
    nested
};


// Compile-time description of field I of record R.
template<class R, std::size_t I>
struct field_schema {
    using Element = introspection::structureElementTypeByIndex<I, R>;
    using Value   = AnnotatedValue<Element>;
    using Opts    = options::detail::aggregate_field_opts_getter<R, I>;

    static_assert(Opts::layoutTagsCount <= 1,
                  "[[[ UboFusion ]]] A field may carry at most one layout tag (as_vec4, as_mat4, as_floats, as_vec4_array)");

    static constexpr bool excluded = Opts::template has_option<options::detail::exclude_tag>;

private:
    static consteval FieldKind detect() {
        if constexpr (excluded) {
            return FieldKind::inert;
        } else if constexpr (Opts::template has_option<options::detail::vec4_tag>) {
            static_assert(Vec4Field<Value>,
                          "[[[ UboFusion ]]] as_vec4 field must hold exactly four numbers");
            return FieldKind::vec4;
        } else if constexpr (Opts::template has_option<options::detail::mat4_tag>) {
            static_assert(Mat4Field<Value>,
                          "[[[ UboFusion ]]] as_mat4 field must hold 16 numbers or 4 vec4 columns");
            return FieldKind::mat4;
        } else if constexpr (Opts::template has_option<options::detail::floats_tag>) {
            using Tag = typename Opts::template get_option<options::detail::floats_tag>;
            static_assert(FloatsField<Value, Tag::count>,
                          "[[[ UboFusion ]]] as_floats field holds fewer numbers than its count");
            return FieldKind::floats;
        } else if constexpr (Opts::template has_option<options::detail::vec4_array_tag>) {
            using Tag = typename Opts::template get_option<options::detail::vec4_array_tag>;
            static_assert(Vec4ArrayField<Value, Tag::count>,
                          "[[[ UboFusion ]]] as_vec4_array field must be a sequence of at most count vec4 values");
            return FieldKind::vec4_array;
        } else if constexpr (Record<Value>) {
            return FieldKind::nested;
        } else {
            return FieldKind::inert;
        }
    }

    static consteval std::size_t detect_count() {
        if constexpr (Opts::template has_option<options::detail::floats_tag>) {
            return Opts::template get_option<options::detail::floats_tag>::count;
        } else if constexpr (Opts::template has_option<options::detail::vec4_array_tag>) {
            return Opts::template get_option<options::detail::vec4_array_tag>::count;
        } else {
            return 1;
        }
    }

    static consteval bool detect_pad() {
        if constexpr (Opts::template has_option<options::detail::floats_tag>) {
            return Opts::template get_option<options::detail::floats_tag>::pad;
        } else {
            return false;
        }
    }

    static consteval std::string_view detect_name() {
        if constexpr (Opts::template has_option<options::detail::label_tag>) {
            return Opts::template get_option<options::detail::label_tag>::desc.toStringView();
        } else {
            return introspection::structureElementNameByIndex<I, R>;
        }
    }

public:
    static constexpr FieldKind kind = detect();
    static constexpr std::size_t count = detect_count();
    static constexpr bool pad = detect_pad();
    static constexpr std::string_view name = detect_name();
};


template<class R>
consteval std::size_t record_depth();

template<class R, std::size_t I>
consteval std::size_t field_depth() {
    using FS = field_schema<R, I>;
    if constexpr (FS::kind == FieldKind::nested) {
        return 1 + record_depth<typename FS::Value>();
    } else if constexpr (FS::kind == FieldKind::vec4_array) {
        return 2;
    } else if constexpr (FS::kind == FieldKind::inert) {
        return 0;
    } else {
        return 1;
    }
}

// Nesting depth of a record, root excluded; bounds the error path.
template<class R>
consteval std::size_t record_depth() {
    using T = std::remove_cvref_t<R>;
    return []<std::size_t... I>(std::index_sequence<I...>) {
        std::size_t deepest = 0;
        ((deepest = std::max(deepest, field_depth<T, I>())), ...);
        return deepest;
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

} // namespace static_schema
} // namespace UboFusion
