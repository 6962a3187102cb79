#include "../test_helpers.hpp"
#include "../../test_model.hpp"
#include <algorithm>

using namespace UboFusion;
using namespace UboFusion::options;
using namespace ubo_fusion_test_models;
using namespace TestHelpers;

// ============================================================================
// Test: output follows declaration order
// ============================================================================

struct ColorFirst {
    Annotated<Vec4, as_vec4>                            color;
    Annotated<Mat4, as_mat4>                            transform;
    Annotated<std::array<float, 3>, as_floats<3, true>> extra;
};

struct TransformFirst {
    Annotated<Mat4, as_mat4>                            transform;
    Annotated<Vec4, as_vec4>                            color;
    Annotated<std::array<float, 3>, as_floats<3, true>> extra;
};

constexpr Mat4 counting_matrix() {
    Mat4 m{};
    for(std::size_t i = 0; i < m.size(); i ++) m[i] = static_cast<float>(i + 1);
    return m;
}

constexpr bool same_bytes(std::span<const std::byte> a, std::span<const std::byte> b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

constexpr bool test_swapped_fields_swap_bytes() {
    ColorFirst a;
    a.color = Vec4{0.25f, 0.5f, 0.75f, 1.0f};
    a.transform = counting_matrix();
    a.extra = std::array<float, 3>{7, 8, 9};

    TransformFirst b;
    b.transform = a.transform.value;
    b.color = a.color.value;
    b.extra = a.extra.value;

    BufferFor<ColorFirst> bufA{};
    BufferFor<TransformFirst> bufB{};
    if(!Write(a, std::span<std::byte>(bufA)) || !Write(b, std::span<std::byte>(bufB))) return false;

    const std::span<const std::byte> A(bufA);
    const std::span<const std::byte> B(bufB);
    return bufA.size() == 96 && bufB.size() == 96
        && same_bytes(A.subspan(0, 16), B.subspan(64, 16))     // color
        && same_bytes(A.subspan(16, 64), B.subspan(0, 64))     // transform
        && same_bytes(A.subspan(80, 16), B.subspan(80, 16))    // extra stays put
        && !same_bytes(A, B);
}
static_assert(test_swapped_fields_swap_bytes(), "Swapping two fields swaps their byte blocks");

constexpr bool test_swapped_slots() {
    constexpr auto sa = SchemaSlots<ColorFirst>();
    constexpr auto sb = SchemaSlots<TransformFirst>();
    return sa[0].name == "color" && sa[0].offset == 0 && sa[1].offset == 16
        && sb[0].name == "transform" && sb[0].offset == 0 && sb[1].offset == 64
        && sa[2].offset == sb[2].offset;
}
static_assert(test_swapped_slots(), "Slot offsets follow the same order");
