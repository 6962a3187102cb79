#include "../test_helpers.hpp"
#include "../../test_model.hpp"
#include <optional>
#include <vector>

using namespace UboFusion;
using namespace UboFusion::options;
using namespace ubo_fusion_test_models;
using namespace TestHelpers;

// ============================================================================
// Test: as_vec4_array<N> - partially filled arrays
// ============================================================================

constexpr bool test_virus_cells() {
    VirusBlock v;
    v.timing = Vec4{1.5f, 2.0f, 0.75f, 0.0f};
    v.tint = Vec4{0.2f, 0.9f, 0.2f, 1.0f};
    v.cells = std::vector<Vec4>{Vec4{1, 2, 3, 4}, Vec4{5, 6, 7, 8}, Vec4{9, 10, 11, 12}};

    BufferFor<VirusBlock> buf{};
    for(auto & b : buf) b = std::byte{0xFF};
    auto r = Write(v, std::span<std::byte>(buf));
    if(!r || r.bytesWritten() != 544) return false;

    if(FloatAt(buf, 0) != 1.5f || FloatAt(buf, 20) != 0.9f) return false;
    for(std::size_t i = 0; i < 12; i ++) {
        if(FloatAt(buf, 32 + 4 * i) != static_cast<float>(i + 1)) return false;
    }
    // elements 3..31 are zero-filled
    for(std::size_t off = 32 + 3 * 16; off < 544; off ++) {
        if(buf[off] != std::byte{0}) return false;
    }
    return true;
}
static_assert(test_virus_cells(), "Missing trailing elements are zero-filled");

constexpr bool test_empty_array() {
    VirusBlock v;
    BufferFor<VirusBlock> buf{};
    for(auto & b : buf) b = std::byte{0xFF};
    if(!Write(v, std::span<std::byte>(buf))) return false;
    for(std::size_t off = 32; off < 544; off ++) {
        if(buf[off] != std::byte{0}) return false;
    }
    return true;
}
static_assert(test_empty_array(), "Empty source writes N zero vec4");

constexpr bool test_full_array() {
    VirusBlock v;
    v.cells = std::vector<Vec4>(32, Vec4{1, 1, 1, 1});
    return WritesFloatsAt(v, 32 + 31 * 16, std::array<float, 4>{1, 1, 1, 1});
}
static_assert(test_full_array(), "Exactly N elements fill the array");

// ============================================================================
// Test: as_vec4_array<N> - errors
// ============================================================================

constexpr bool test_too_many() {
    VirusBlock v;
    v.cells = std::vector<Vec4>(33, Vec4{});
    return WriteFailsAt(v, WriteError::TOO_MANY_ELEMENTS, 32, 33, "cells");
}
static_assert(test_too_many(), "More than N elements is an error");

struct Ragged {
    Annotated<std::vector<std::vector<float>>, as_vec4_array<4>> rows;
};

constexpr bool test_bad_element() {
    Ragged r;
    r.rows = std::vector<std::vector<float>>{{1, 2, 3, 4}, {1, 2, 3}};
    return WriteFailsAt(r, WriteError::WRONG_COMPONENT_COUNT, 4, 3, "rows", 1);
}
static_assert(test_bad_element(), "Bad element reports its index");

// ============================================================================
// Test: as_vec4_array<N> - fixed arrays and absent values
// ============================================================================

struct ShortFixed {
    Annotated<std::array<Vec4, 2>, as_vec4_array<3>> a;
};
static_assert(WritesFloats(ShortFixed{std::array<Vec4, 2>{Vec4{1, 2, 3, 4}, Vec4{5, 6, 7, 8}}},
                           std::array<float, 12>{1, 2, 3, 4, 5, 6, 7, 8, 0, 0, 0, 0}),
              "Fixed array shorter than N is zero-filled");

struct OptionalElements {
    Annotated<std::array<std::optional<Vec4>, 2>, as_vec4_array<2>> a;
};
static_assert(WritesFloats(OptionalElements{std::array<std::optional<Vec4>, 2>{std::nullopt, Vec4{1, 2, 3, 4}}},
                           std::array<float, 8>{0, 0, 0, 0, 1, 2, 3, 4}),
              "Absent elements are written as zeros");

struct OptionalArray {
    Annotated<Vec4, as_vec4>                                        head;
    Annotated<std::optional<std::vector<Vec4>>, as_vec4_array<2>>   a;
};
static_assert(WritesFloats(OptionalArray{Vec4{9, 9, 9, 9}, std::nullopt},
                           std::array<float, 12>{9, 9, 9, 9, 0, 0, 0, 0, 0, 0, 0, 0}),
              "Absent array is written as zeros");

struct StructElements {
    Annotated<std::array<base_blocks::LightColor, 2>, as_vec4_array<2>> colors;
};
static_assert(WritesFloats(StructElements{std::array<base_blocks::LightColor, 2>{
                               base_blocks::LightColor{1, 0, 0, 0.5f}, base_blocks::LightColor{0, 1, 0, 0.25f}}},
                           std::array<float, 8>{1, 0, 0, 0.5f, 0, 1, 0, 0.25f}),
              "Numeric structs work as array elements");
