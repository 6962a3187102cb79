#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace UboFusion {

// Explicit field list for records PFR cannot reflect (or whose layout order
// should differ from member order). The list order is the declaration order.
template <class ... Flds>
struct StructMeta {

};
template <auto MPtr, ConstString key, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString key, class ... Opts>
struct Field<MPtr, key, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name  = key;
    static constexpr  T C::* MemberP = MPtr;

};



template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {


template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        return (pfr::get<Index>(s));
    }

    template<std::size_t Index>
        static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... Field>
struct is_fields_pack<StructFields<Field...>> : std::true_type {};

template<class T>
inline constexpr bool is_fields_pack_v = is_fields_pack<T>::value;


template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T,
                                          std::void_t<typename StructMeta<T>::Fields>
                                          > : std::bool_constant<
                                                  is_fields_pack_v<typename StructMeta<T>::Fields>
                                                  > {};

template<class T>
inline constexpr bool has_struct_meta_specialization =
    has_struct_meta_specialization_impl<T>::value;

template <class T, class OptPack> struct AnnotationFiller;
template <class T, class ...Opts> struct AnnotationFiller<T, OptionsPack<Opts...>> {
    using type = Annotated<T, Opts...>;
};


template <class T>
requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;


    template<std::size_t Index, class StructT>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        using Field = std::tuple_element_t<Index, Fields>;
        return (s.*(Field::MemberP));
    }

    template<std::size_t Index, class StructT>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        using Field = std::tuple_element_t<Index, Fields>;
        return (s.*(Field::MemberP));
    }


    // Options listed in Field<> travel with the element type, so the rest of
    // the library sees them exactly like an in-type Annotated<> member.
    template<std::size_t Index>
    using structureElementTypeByIndex = typename AnnotationFiller<
                                        typename std::tuple_element_t<Index, Fields>::ValueT,
                                        typename std::tuple_element_t<Index, Fields>::OptionsP
                                        >::type;


    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex =
        std::tuple_element_t<Index, Fields>::Name.toStringView();
};

template<class T>
constexpr std::string_view type_name_raw() {
#if defined(__clang__) || defined(__GNUC__)
    const std::string_view fn = __PRETTY_FUNCTION__;
    const std::string_view marker = "T = ";
    const std::size_t begin = fn.find(marker) + marker.size();
    const std::size_t end = fn.find_first_of(";]", begin);
    return fn.substr(begin, end - begin);
#elif defined(_MSC_VER)
    const std::string_view fn = __FUNCSIG__;
    const std::string_view marker = "type_name_raw<";
    const std::size_t begin = fn.find(marker) + marker.size();
    const std::size_t end = fn.rfind(">(void)");
    std::string_view name = fn.substr(begin, end - begin);
    for(std::string_view prefix : {std::string_view("struct "), std::string_view("class ")}) {
        if(name.starts_with(prefix)) name.remove_prefix(prefix.size());
    }
    return name;
#else
    return "record";
#endif
}

template<class T>
struct TypeNameHolder {
    static constexpr std::string_view raw = type_name_raw<T>();
    static constexpr std::array<char, raw.size()> storage = [] {
        std::array<char, raw.size()> out{};
        for(std::size_t i = 0; i < raw.size(); i ++) out[i] = raw[i];
        return out;
    }();
    static constexpr std::string_view value{storage.data(), storage.size()};
};


}
template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}
template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

// Compiler-provided spelling of T, used when a record has no block<> name.
template<class T>
inline constexpr std::string_view typeName = detail::TypeNameHolder<std::remove_cv_t<T>>::value;

}
}
