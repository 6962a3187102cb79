#include "../test_helpers.hpp"
#include "../../test_model.hpp"

using namespace UboFusion;
using namespace UboFusion::options;
using namespace ubo_fusion_test_models;

// ============================================================================
// Test: SchemaSlots - flat record
// ============================================================================

constexpr auto particle_slots = SchemaSlots<Particle>();

static_assert(particle_slots.size() == 3);

static_assert(particle_slots[0].name == "position"
              && particle_slots[0].kind == SlotKind::vec4
              && particle_slots[0].offset == 0
              && particle_slots[0].size == 16,
              "First slot: position, vec4 at 0");

static_assert(particle_slots[1].name == "color"
              && particle_slots[1].offset == 16
              && particle_slots[1].size == 16,
              "Second slot: color at 16");

static_assert(particle_slots[2].name == "extra"
              && particle_slots[2].kind == SlotKind::floats
              && particle_slots[2].count == 3
              && particle_slots[2].pad
              && particle_slots[2].offset == 32
              && particle_slots[2].size == 16,
              "Third slot: padded float[3] at 32");

static_assert(particle_slots[0].record == BlockName<Particle>()
              && particle_slots[0].source == SlotSource::schema,
              "Slots carry the owning record");

// ============================================================================
// Test: SchemaSlots - arrays and block names
// ============================================================================

constexpr auto virus_slots = SchemaSlots<VirusBlock>();

static_assert(virus_slots.size() == 3);
static_assert(virus_slots[2].kind == SlotKind::vec4_array
              && virus_slots[2].count == 32
              && virus_slots[2].offset == 32
              && virus_slots[2].size == 512,
              "vec4 array slot spans 32 * 16 bytes");
static_assert(virus_slots[0].record == "VirusBlockConfig", "block<> option names the record");

// ============================================================================
// Test: SchemaSlots - nested records are expanded in place
// ============================================================================

struct Outer {
    Annotated<Vec4, as_vec4> head;
    Particle                 p;
    Annotated<Vec4, as_vec4> tail;
};

constexpr auto outer_slots = SchemaSlots<Outer>();

static_assert(outer_slots.size() == 5, "head + three particle slots + tail");
static_assert(outer_slots[1].name == "position" && outer_slots[1].offset == 16,
              "Nested slot offsets are absolute");
static_assert(outer_slots[3].name == "extra" && outer_slots[3].offset == 48);
static_assert(outer_slots[4].name == "tail" && outer_slots[4].offset == 64);
static_assert(outer_slots[0].record == BlockName<Outer>()
              && outer_slots[1].record == BlockName<Particle>(),
              "Nested slots name the nested record");

// ============================================================================
// Test: SchemaSlots - inert fields and labels
// ============================================================================

struct WithInert {
    int                                                   id;
    Annotated<Vec4, as_vec4, label<"Anchor">>             anchor;
    Annotated<Vec4, as_vec4, exclude>                     hidden;
    Annotated<std::array<float, 2>, as_floats<2>>         uv;
};

constexpr auto inert_slots = SchemaSlots<WithInert>();

static_assert(inert_slots.size() == 2, "Untagged and excluded fields have no slot");
static_assert(inert_slots[0].name == "Anchor", "label<> replaces the member name");
static_assert(inert_slots[1].name == "uv" && inert_slots[1].offset == 16 && inert_slots[1].size == 8);

// Offsets are a running sum of slot sizes
constexpr bool offsets_are_running_sum() {
    constexpr auto slots = SchemaSlots<Outer>();
    std::size_t expected = 0;
    for(const auto & s : slots) {
        if(s.offset != expected) return false;
        expected += s.size;
    }
    return expected == CalculateSize<Outer>();
}
static_assert(offsets_are_running_sum(), "Slot offsets add up to the record size");
