#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace UboFusion {

namespace options {

namespace detail {

struct vec4_tag{};
struct mat4_tag{};
struct floats_tag{};
struct vec4_array_tag{};

struct exclude_tag{};
struct label_tag{};
struct block_tag{};
}

/// Field is one std140 vec4: four numeric components, 16 bytes.
struct as_vec4 {
    using tag = detail::vec4_tag;
    static constexpr bool is_layout_tag = true;
    static constexpr std::string_view to_string() {
        return "as_vec4";
    }
};

/// Field is one std140 mat4: four column vec4s, 64 bytes.
struct as_mat4 {
    using tag = detail::mat4_tag;
    static constexpr bool is_layout_tag = true;
    static constexpr std::string_view to_string() {
        return "as_mat4";
    }
};

/// Field is Count tightly packed floats; with Pad the run is zero-filled up
/// to the next 16-byte boundary.
template<std::size_t Count, bool Pad = false>
struct as_floats {
    static_assert(Count > 0, "[[[ UboFusion ]]] as_floats needs at least one float");
    using tag = detail::floats_tag;
    static constexpr bool is_layout_tag = true;
    static constexpr std::size_t count = Count;
    static constexpr bool pad = Pad;
    static constexpr std::string_view to_string() {
        return "as_floats";
    }
};

/// Field is an array of Count vec4s; missing trailing elements are zeros.
template<std::size_t Count>
struct as_vec4_array {
    static_assert(Count > 0, "[[[ UboFusion ]]] as_vec4_array needs at least one element");
    using tag = detail::vec4_array_tag;
    static constexpr bool is_layout_tag = true;
    static constexpr std::size_t count = Count;
    static constexpr std::string_view to_string() {
        return "as_vec4_array";
    }
};

struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

template<ConstString Name>
struct label {
    static_assert(Name.isIdentifier(), "[[[ UboFusion ]]] label must be an identifier");
    using tag = detail::label_tag;
    static constexpr auto desc = Name;
    static constexpr std::string_view to_string() {
        return "label";
    }
};

/// Record-level: name of the GLSL uniform block this record mirrors.
template<ConstString Name>
struct block {
    static_assert(Name.isIdentifier(), "[[[ UboFusion ]]] block name must be an identifier");
    using tag = detail::block_tag;
    static constexpr auto desc = Name;
    static constexpr std::string_view to_string() {
        return "block";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Opt, class = void>
struct is_layout_option : std::false_type {};

template<class Opt>
struct is_layout_option<Opt, std::void_t<decltype(Opt::is_layout_tag)>>
    : std::bool_constant<Opt::is_layout_tag> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

    static constexpr std::size_t layoutTagsCount = (std::size_t{0} + ... + (is_layout_option<Opts>::value ? 1 : 0));
};

using no_options = field_options<OptionsPack<>>;

template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;

template<class T, class = void>
struct has_annotation_specialization_impl : std::false_type {};

template<class T>
struct has_annotation_specialization_impl<T,
                                          std::void_t<typename Annotated<T>::Options>
                                          > : std::bool_constant<
                                                                 is_options_pack_v<typename Annotated<T>::Options>
                                                                    && (Annotated<T>::Options::Count > 0)
                                                                 > {};

template<class T>
inline constexpr bool has_annotation_specialization =
    has_annotation_specialization_impl<T>::value;

template<class Field>
struct annotation_meta{};

// Plain field
template<class T>
    requires (!has_annotation_specialization<T>)
struct annotation_meta<T> {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ UboFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ UboFusion ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};

// Annotated<T, Opts...>
template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = T;
    using options      = field_options<
        OptionsPack<Opts...>
        >;

    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta fields hand out the raw member while carrying the options
    // in the element type.
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

// Externally Annotated<T>
template<class T> requires has_annotation_specialization<T>
struct annotation_meta<T> {
    using value_t = T;
    using options      = field_options<typename Annotated<T>::Options>;

    using OptionsP = typename Annotated<T>::Options;

    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }

};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class T, std::size_t I, class = void>
struct has_field_annotation_specialization_impl : std::false_type {
    using Options = OptionsPack<>;
};

template<class T, std::size_t I>
struct has_field_annotation_specialization_impl<T, I,
                                          std::void_t<typename AnnotatedField<T, I>::Options>
                                          > : std::bool_constant<
                                                  is_options_pack_v<typename AnnotatedField<T, I>::Options>
                                                  && (AnnotatedField<T, I>::Options::Count > 0)
                                                  > {
    using Options = typename AnnotatedField<T, I>::Options;
};

// Options of field I of an aggregate: AnnotatedField<> first, then the
// options carried by the member type itself.
template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using Meta = annotation_meta_getter<Field>;
    using ExternalOpts = typename has_field_annotation_specialization_impl<AggregateT, Index>::Options;
    using options      = field_options<
        typename merge_options<ExternalOpts, typename Meta::OptionsP>::type
    >;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter =  typename aggregate_field_opts<std::remove_cvref_t<AggregateT>, Index>::options;

// Record-level options come only from an external Annotated<T> specialization.
template<class T>
using record_opts_getter = typename annotation_meta_getter<T>::options;

} // namespace detail

} //namespace options

} // namespace UboFusion
