#pragma once

#include <cstddef>
#include <concepts>
#include <memory>
#include <utility>

namespace UboFusion {

template<class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

// Attaches layout options to a field without changing how it is accessed.
// Specialize the single-argument form (Annotated<T>) with a nested
// `using Options = OptionsPack<...>` to annotate a type from the outside.
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

// Per-field external annotation: specialize with
// `using Options = OptionsPack<...>` for field I of aggregate T.
template<class T, std::size_t I>
struct AnnotatedField {};

} // namespace UboFusion
