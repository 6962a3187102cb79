#include "../test_helpers.hpp"
#include "../../test_model.hpp"
#include <UboFusion/declaration.hpp>
#include <string>
#include <utility>

using namespace UboFusion;
using namespace ubo_fusion_test_models;

// ============================================================================
// Test: ParseDeclaration - well-formed blocks
// ============================================================================

constexpr bool test_particle_block() {
    auto r = ParseDeclaration(particle_glsl, "Particle");
    if(!r || r.blockName() != "Particle") return false;
    const auto & s = r.slots();
    return s.size() == 3
        && s[0].name == "Position" && s[0].kind == SlotKind::vec4 && s[0].offset == 0 && s[0].size == 16
        && s[1].name == "Color"    && s[1].offset == 16
        && s[2].name == "Extra"    && s[2].kind == SlotKind::vec3 && s[2].offset == 32 && s[2].size == 16
        && s[2].source == SlotSource::declaration
        && s[2].record == "Particle"
        && r.totalSize() == 48;
}
static_assert(test_particle_block(), "vec3 occupies a full 16-byte slot");

constexpr bool test_first_block_when_unnamed() {
    auto r = ParseDeclaration(particle_glsl);
    return r && r.blockName() == "Particle" && r.slots().size() == 3;
}
static_assert(test_first_block_when_unnamed(), "Empty block name selects the first uniform block");

constexpr bool test_virus_block() {
    auto r = ParseDeclaration(virus_block_glsl, "VirusBlockConfig");
    if(!r) return false;
    const auto & s = r.slots();
    return s.size() == 3
        && s[2].name == "Cells"
        && s[2].kind == SlotKind::vec4_array
        && s[2].count == 32
        && s[2].size == 512
        && r.totalSize() == 544;
}
static_assert(test_virus_block(), "Layout qualifiers with bindings, instance names and trailing code are accepted");

constexpr std::string_view two_blocks = R"(
uniform sampler2D Albedo;
uniform float Exposure;

layout(std140) uniform First {
    vec4 A;
};

layout(std140) uniform Second {
    highp vec4 B;       // precision qualifier
    /* skipped */ mat4 M;
    mediump vec2 UV;
    lowp float F;
    float Weights[4];
    mat3 N;
};
)";

constexpr bool test_select_second() {
    auto r = ParseDeclaration(two_blocks, "Second");
    if(!r || r.blockName() != "Second") return false;
    const auto & s = r.slots();
    return s.size() == 6
        && s[0].name == "B" && s[0].size == 16
        && s[1].kind == SlotKind::mat4 && s[1].size == 64
        && s[2].kind == SlotKind::vec2 && s[2].size == 8 && s[2].offset == 80
        && s[3].kind == SlotKind::scalar && s[3].size == 4 && s[3].offset == 88
        && s[4].kind == SlotKind::array && s[4].count == 4 && s[4].size == 64 && s[4].offset == 96
        && s[5].kind == SlotKind::mat3 && s[5].size == 48 && s[5].offset == 160
        && r.totalSize() == 208;
}
static_assert(test_select_second(), "Named block is found past other uniforms and blocks");

constexpr bool test_first_of_two() {
    auto r = ParseDeclaration(two_blocks);
    return r && r.blockName() == "First" && r.slots().size() == 1;
}
static_assert(test_first_of_two(), "Plain uniforms are not blocks");

constexpr std::string_view other_layout_skipped = R"(
layout(std430) uniform Packed {
    vec3 a;
    float b;
};
layout(std140) uniform Wanted {
    vec4 A;
};
)";
static_assert(ParseDeclaration(other_layout_skipped, "Wanted"),
              "Unsupported layout on another block does not matter");

// ============================================================================
// Test: ParseDeclaration - std140 base alignment
// ============================================================================

constexpr bool test_aligned_offsets() {
    auto r = ParseDeclaration("uniform B { float a; vec2 b; float c; float w[2]; vec4 d; };");
    if(!r) return false;
    const auto & s = r.slots();
    return s.size() == 5
        && s[0].offset == 0  && s[0].size == 4
        && s[1].offset == 8  && s[1].size == 8
        && s[2].offset == 16 && s[2].size == 4
        && s[3].offset == 32 && s[3].size == 32
        && s[4].offset == 64 && s[4].size == 16
        && r.totalSize() == 80;
}
static_assert(test_aligned_offsets(), "vec2 aligns to 8, arrays and vec4 to 16");

constexpr bool test_scalar_then_array() {
    auto r = ParseDeclaration("uniform B { float a; float w[2]; };");
    return r && r.slots()[1].offset == 16 && r.totalSize() == 48;
}
static_assert(test_scalar_then_array(), "Scalar arrays start on a 16-byte boundary");

constexpr bool test_matrices_align_to_16() {
    auto r = ParseDeclaration("uniform B { float a; mat2 m; vec2 b; mat3 n; };");
    if(!r) return false;
    const auto & s = r.slots();
    return s[1].offset == 16 && s[1].size == 32
        && s[2].offset == 48
        && s[3].offset == 64 && s[3].size == 48;
}
static_assert(test_matrices_align_to_16());

constexpr bool test_vec3_packs_scalar() {
    auto r = ParseDeclaration("uniform B { vec3 a; float b; vec3 c; vec2 d; vec3 e; };");
    if(!r) return false;
    const auto & s = r.slots();
    return s[0].size == 12 && s[1].offset == 12
        && s[2].offset == 16 && s[2].size == 16
        && s[3].offset == 32
        && s[4].offset == 48 && s[4].size == 16
        && r.totalSize() == 64;
}
static_assert(test_vec3_packs_scalar(), "A scalar fills the fourth component of a vec3");

template<class S>
concept ParsesFrom = requires(S && s) { ParseDeclaration(std::forward<S>(s)); };

static_assert(ParsesFrom<std::string_view>);
static_assert(ParsesFrom<const std::string &>);
static_assert(!ParsesFrom<std::string>, "Temporary strings are refused");

// ============================================================================
// Test: ParseDeclaration - errors
// ============================================================================

constexpr bool test_block_not_found() {
    auto r = ParseDeclaration(particle_glsl, "Missing");
    return !r && r.error() == DeclarationError::BLOCK_NOT_FOUND && r.blockName() == "Missing";
}
static_assert(test_block_not_found());

static_assert(ParseDeclaration("void main() {}").error() == DeclarationError::BLOCK_NOT_FOUND,
              "Source without uniform blocks");

constexpr bool test_unknown_type() {
    auto r = ParseDeclaration("\nuniform B {\n    dvec4 X;\n};\n");
    return !r
        && r.error() == DeclarationError::UNKNOWN_TYPE
        && r.token() == "dvec4"
        && r.line() == 3
        && r.column() == 5
        && r.blockName() == "B";
}
static_assert(test_unknown_type(), "Unknown type is reported with its position");

static_assert(ParseDeclaration("uniform B { vec4 A vec4 C; };").error() == DeclarationError::UNEXPECTED_TOKEN,
              "Missing semicolon");
static_assert(ParseDeclaration("uniform B { vec4 A; }").error() == DeclarationError::UNTERMINATED_BLOCK,
              "Missing semicolon after the block");
static_assert(ParseDeclaration("uniform B { vec4 A;").error() == DeclarationError::UNTERMINATED_BLOCK,
              "Missing closing brace");
static_assert(ParseDeclaration("uniform B { vec4 A; } x y;").error() == DeclarationError::UNEXPECTED_TOKEN);

constexpr bool test_unterminated_comment() {
    auto r = ParseDeclaration("uniform B {\n  vec4 A; /* open\n  vec4 C;\n");
    return r.error() == DeclarationError::UNTERMINATED_COMMENT && r.line() == 2 && r.column() == 11;
}
static_assert(test_unterminated_comment(), "Unterminated comment points at its start");

constexpr bool test_unsupported_layout() {
    auto r = ParseDeclaration("layout(std430) uniform B { vec4 A; };", "B");
    return r.error() == DeclarationError::UNSUPPORTED_LAYOUT && r.token() == "std430";
}
static_assert(test_unsupported_layout(), "std430 blocks are refused");
static_assert(ParseDeclaration("layout(packed) uniform B { vec4 A; };").error() == DeclarationError::UNSUPPORTED_LAYOUT);
static_assert(ParseDeclaration("layout(shared, binding = 2) uniform B { vec4 A; };").error() == DeclarationError::UNSUPPORTED_LAYOUT);
static_assert(ParseDeclaration("layout(binding = 2) uniform B { vec4 A; };"), "Layout without packing rule is std140");

static_assert(ParseDeclaration("uniform B { vec4 A[0]; };").error() == DeclarationError::BAD_ARRAY_SIZE);
static_assert(ParseDeclaration("uniform B { vec4 A[N]; };").error() == DeclarationError::BAD_ARRAY_SIZE,
              "Array sizes must be literals");
static_assert(ParseDeclaration("uniform B { vec4 A[0x10]; };").error() == DeclarationError::BAD_ARRAY_SIZE);
static_assert(ParseDeclaration("uniform B { vec4 A[]; };").error() == DeclarationError::BAD_ARRAY_SIZE);
