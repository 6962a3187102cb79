#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "layout.hpp"

namespace UboFusion {

// Binding slot convention
enum class BindingRange {
    base,             //  0-9   engine-level blocks, always bound
    pass,             // 10-19  pass / post-processing (reserved)
    effect_config,    // 20-29  effect presets, rarely updated
    effect_runtime,   // 30-39  per-frame effect state
    out_of_range
};

constexpr std::string_view binding_range_to_string(BindingRange r) {
    switch(r) {
    case BindingRange::base          : return "base"; break;
    case BindingRange::pass          : return "pass"; break;
    case BindingRange::effect_config : return "effect_config"; break;
    case BindingRange::effect_runtime: return "effect_runtime"; break;
    case BindingRange::out_of_range  : return "out_of_range"; break;
    }
    return "N/A";
}

constexpr BindingRange RangeOfSlot(std::size_t slot) {
    if(slot < 10) return BindingRange::base;
    if(slot < 20) return BindingRange::pass;
    if(slot < 30) return BindingRange::effect_config;
    if(slot < 40) return BindingRange::effect_runtime;
    return BindingRange::out_of_range;
}

struct BindingEntry {
    std::string name;
    std::size_t slot = 0;
    std::size_t expectedSize = 0;

    constexpr BindingRange range() const {
        return RangeOfSlot(slot);
    }
};


class BindingResult {
    BindingError m_error = BindingError::none;
    std::string m_name;
    std::size_t m_slot = 0;
    std::size_t m_expected = 0;
    std::size_t m_actual = 0;
public:
    constexpr BindingResult(BindingError err, std::string_view name, std::size_t slot,
                            std::size_t expected, std::size_t actual):
        m_error(err), m_name(name), m_slot(slot), m_expected(expected), m_actual(actual)
    {}
    constexpr operator bool() const {
        return m_error == BindingError::none;
    }
    constexpr BindingError error() const {
        return m_error;
    }
    constexpr std::string_view name() const {
        return m_name;
    }
    constexpr std::size_t slot() const {
        return m_slot;
    }
    // Registered size vs. size calculated from the record
    constexpr std::size_t expected() const {
        return m_expected;
    }
    constexpr std::size_t actual() const {
        return m_actual;
    }
};


/// Size-only check between a record's calculated size and the size the
/// binding was registered with.
constexpr BindingResult ValidateSize(std::string_view name, std::size_t calculated, std::size_t expected) {
    if(calculated != expected) {
        return BindingResult(BindingError::size_mismatch, name, 0, expected, calculated);
    }
    return BindingResult(BindingError::none, name, 0, expected, calculated);
}


/// Table of uniform block bindings: filled once at start-up, then frozen.
class BindingRegistry {
    std::vector<BindingEntry> m_entries;
    bool m_frozen = false;
public:
    static constexpr std::size_t max_slot = 39;

    constexpr BindingResult registerBinding(std::string_view name, std::size_t slot, std::size_t expectedSize) {
        if(m_frozen) {
            return BindingResult(BindingError::frozen, name, slot, expectedSize, 0);
        }
        if(slot > max_slot) {
            return BindingResult(BindingError::slot_out_of_range, name, slot, expectedSize, 0);
        }
        if(expectedSize == 0) {
            return BindingResult(BindingError::invalid_size, name, slot, expectedSize, 0);
        }
        if(const BindingEntry * e = find(name); e != nullptr) {
            return BindingResult(BindingError::duplicate_name, name, e->slot, e->expectedSize, expectedSize);
        }
        if(const BindingEntry * e = findSlot(slot); e != nullptr) {
            return BindingResult(BindingError::duplicate_slot, e->name, slot, e->expectedSize, expectedSize);
        }
        m_entries.push_back(BindingEntry{std::string(name), slot, expectedSize});
        return BindingResult(BindingError::none, name, slot, expectedSize, expectedSize);
    }

    // Registers T under its block name with its calculated size.
    template<class T>
    constexpr BindingResult registerBinding(std::size_t slot) {
        return registerBinding(BlockName<T>(), slot, CalculateSize<T>());
    }

    constexpr void freeze() {
        m_frozen = true;
    }
    constexpr bool frozen() const {
        return m_frozen;
    }

    constexpr const BindingEntry * find(std::string_view name) const {
        for(const auto & e : m_entries) {
            if(e.name == name) return &e;
        }
        return nullptr;
    }
    constexpr const BindingEntry * findSlot(std::size_t slot) const {
        for(const auto & e : m_entries) {
            if(e.slot == slot) return &e;
        }
        return nullptr;
    }

    constexpr BindingResult checkBinding(std::string_view name, std::size_t calculatedSize) const {
        const BindingEntry * e = find(name);
        if(e == nullptr) {
            return BindingResult(BindingError::unknown_binding, name, 0, 0, calculatedSize);
        }
        if(e->expectedSize != calculatedSize) {
            return BindingResult(BindingError::size_mismatch, name, e->slot, e->expectedSize, calculatedSize);
        }
        return BindingResult(BindingError::none, name, e->slot, e->expectedSize, calculatedSize);
    }

    template<class T>
    constexpr BindingResult checkBinding() const {
        return checkBinding(BlockName<T>(), CalculateSize<T>());
    }

    constexpr const std::vector<BindingEntry> & entries() const {
        return m_entries;
    }
};

} // namespace UboFusion
