#include "../test_helpers.hpp"
#include "../../test_model.hpp"
#include <optional>
#include <vector>

using namespace UboFusion;
using namespace UboFusion::options;
using namespace ubo_fusion_test_models;
using namespace TestHelpers;

constexpr std::array<float, 16> identity{
    1, 0, 0, 0,
    0, 1, 0, 0,
    0, 0, 1, 0,
    0, 0, 0, 1
};

constexpr Mat4 sequence() {
    Mat4 m{};
    for(std::size_t i = 0; i < 16; i ++) m[i] = static_cast<float>(i);
    return m;
}

// ============================================================================
// Test: as_mat4 - flat column-major values
// ============================================================================

struct Flat {
    Annotated<Mat4, as_mat4> m;
};
static_assert(WritesFloats(Flat{sequence()}, sequence()), "Flat matrix is copied as is");

// ============================================================================
// Test: as_mat4 - four vec4 columns
// ============================================================================

struct Columns {
    Annotated<std::array<Vec4, 4>, as_mat4> m;
};

constexpr bool test_columns() {
    Columns c;
    for(std::size_t col = 0; col < 4; col ++) {
        for(std::size_t row = 0; row < 4; row ++) {
            c.m.value[col][row] = static_cast<float>(col * 4 + row);
        }
    }
    return WritesFloats(c, sequence());
}
static_assert(test_columns(), "Outer index is the column");

// ============================================================================
// Test: as_mat4 - absent matrix is identity
// ============================================================================

struct Maybe {
    Annotated<std::optional<Mat4>, as_mat4> m;
};
static_assert(WritesFloats(Maybe{std::nullopt}, identity), "Absent matrix is written as identity");
static_assert(WritesFloats(Maybe{sequence()}, sequence()), "Present matrix is written as is");

// ============================================================================
// Test: as_mat4 - run-time sized values
// ============================================================================

struct DynamicFlat {
    Annotated<std::vector<float>, as_mat4> m;
};

constexpr bool test_dynamic_flat_ok() {
    DynamicFlat d;
    const Mat4 s = sequence();
    d.m = std::vector<float>(s.begin(), s.end());
    return WritesFloats(d, sequence());
}
static_assert(test_dynamic_flat_ok());

constexpr bool test_dynamic_flat_short() {
    DynamicFlat d;
    d.m = std::vector<float>(9, 1.0f);
    return WriteFailsAt(d, WriteError::WRONG_COMPONENT_COUNT, 16, 9, "m");
}
static_assert(test_dynamic_flat_short(), "mat3-sized data is rejected");

struct DynamicColumns {
    Annotated<std::vector<Vec4>, as_mat4> m;
};

constexpr bool test_dynamic_columns_short() {
    DynamicColumns d;
    d.m = std::vector<Vec4>(3, Vec4{1, 1, 1, 1});
    return WriteFailsAt(d, WriteError::WRONG_COMPONENT_COUNT, 4, 3, "m");
}
static_assert(test_dynamic_columns_short(), "Three columns are rejected");

// ============================================================================
// Test: as_mat4 inside a record
// ============================================================================

constexpr bool test_camera_identity_default() {
    base_blocks::Camera cam{};
    BufferFor<base_blocks::Camera> buf{};
    if(!Write(cam, std::span<std::byte>(buf))) return false;
    // viewProj starts after four vec4 members
    for(std::size_t i = 0; i < 16; i ++) {
        if(FloatAt(buf, 64 + 4 * i) != identity[i]) return false;
        if(FloatAt(buf, 128 + 4 * i) != identity[i]) return false;
    }
    return FloatAt(buf, 16 + 8) == -1.0f;   // forward.z
}
static_assert(test_camera_identity_default(), "Unset camera matrices are identity");
