#pragma once

#include <array>
#include <cstddef>
#include <limits>
#include <string_view>
#include <type_traits>

#include "static_schema.hpp"

namespace UboFusion {
namespace path {

inline constexpr std::size_t no_index = std::numeric_limits<std::size_t>::max();

struct PathElement {
    std::size_t      array_index = no_index;   // vec4 array element
    std::string_view field_name;                // static field name otherwise

    constexpr bool is_index() const {
        return array_index != no_index;
    }
};

// Position of a value inside a record: field names from the root down, with an
// element index for vec4 arrays. SchemaDepth excludes the root.
template<std::size_t SchemaDepth>
struct Path {
    static constexpr std::size_t Capacity = SchemaDepth > 0 ? SchemaDepth : 1;

    std::array<PathElement, Capacity> storage{};
    std::size_t currentLength = 0;

    constexpr Path() = default;

    template <class ... PathElems>
        requires (sizeof...(PathElems) > 0 && (!std::is_same_v<PathElems, Path> && ...))
    constexpr Path(PathElems ... args) {
        auto toPathElement = []<class ArgT>(ArgT arg) {
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                return PathElement{no_index, std::string_view(arg)};
            } else if constexpr (std::is_convertible_v<ArgT, std::size_t>) {
                return PathElement{static_cast<std::size_t>(arg), std::string_view()};
            } else {
                static_assert(!sizeof(arg), "[[[ UboFusion ]]] Use integers or string-compatible segments in Path construction");
            }
        };
        static_assert(sizeof...(args) <= Capacity, "[[[ UboFusion ]]] Path is deeper than the record");
        ((storage[currentLength++] = toPathElement(args)), ...);
    }

    constexpr void push_field(std::string_view name) {
        storage[currentLength++] = PathElement{no_index, name};
    }
    constexpr void push_index(std::size_t index) {
        storage[currentLength++] = PathElement{index, {}};
    }
    constexpr void pop() {
        currentLength --;
    }

    constexpr std::size_t size() const {
        return currentLength;
    }
    constexpr const PathElement & operator[](std::size_t i) const {
        return storage[i];
    }

    template<std::size_t OtherDepth>
    constexpr bool operator==(const Path<OtherDepth> & other) const {
        if(currentLength != other.currentLength) return false;
        for(std::size_t i = 0; i < currentLength; i ++) {
            if(storage[i].array_index != other.storage[i].array_index) return false;
            if(storage[i].field_name != other.storage[i].field_name) return false;
        }
        return true;
    }
};

template<class T>
using PathFor = Path<static_schema::record_depth<T>()>;

} // namespace path
} // namespace UboFusion
