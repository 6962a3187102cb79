#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "layout.hpp"
#include "path.hpp"
#include "writer.hpp"
#include "declaration.hpp"
#include "validator.hpp"
#include "registry.hpp"
#include "startup_check.hpp"

namespace UboFusion {

namespace error_formatting_detail {

inline std::string slot_type(const SlotDescr & s) {
    switch(s.kind) {
    case SlotKind::floats:
        return std::format("float[{}]{}", s.count, s.pad ? " padded" : "");
    case SlotKind::vec4_array:
        return std::format("vec4[{}]", s.count);
    case SlotKind::array:
        return std::format("array[{}]", s.count);
    default:
        return std::string(slot_kind_to_string(s.kind));
    }
}

inline std::string slot_line(std::size_t i, const SlotDescr & s, bool marked) {
    return std::format("  {:>3} {:<24} {:<16} {:>5} B @{:<5}{}\n",
                       i, s.name, slot_type(s), s.size, s.offset, marked ? " <--" : "");
}

inline std::string slot_list(std::string_view title, const std::vector<SlotDescr> & slots, std::size_t marked) {
    const std::size_t total = slots.empty() ? 0 : slots.back().offset + slots.back().size;
    std::string out = std::format(" {} ({} slots, {} bytes):\n", title, slots.size(), total);
    for(std::size_t i = 0; i < slots.size(); i ++) {
        out += slot_line(i, slots[i], i == marked);
    }
    return out;
}

} // namespace error_formatting_detail


template<std::size_t SchemaDepth>
std::string PathToString(const path::Path<SchemaDepth> & p) {
    std::string out = "$";
    for(std::size_t i = 0; i < p.size(); i ++) {
        if(p[i].is_index()) {
            out += std::format("[{}]", p[i].array_index);
        } else {
            out += std::format(".{}", p[i].field_name);
        }
    }
    return out;
}

template<std::size_t SchemaDepth>
std::string WriteResultToString(const WriteResult<SchemaDepth> & res) {
    if(res) {
        return std::format("'{}' written: {} bytes", res.record(), res.bytesWritten());
    }
    switch(res.error()) {
    case WriteError::BUFFER_TOO_SMALL:
        return std::format("Writing '{}': buffer too small, need {} bytes, {} available",
                           res.record(), res.expected(), res.actual());
    case WriteError::LAYOUT_DRIFT:
        return std::format("Writing '{}': layout drift, calculated {} bytes but {} were written",
                           res.record(), res.expected(), res.actual());
    case WriteError::SINK_OVERFLOW:
        return std::format("Writing '{}' at {}: sink overflow after {} bytes",
                           res.record(), PathToString(res.errorPath()), res.bytesWritten());
    default:
        return std::format("Writing '{}' at {}: error '{}', expected {}, got {}",
                           res.record(), PathToString(res.errorPath()), error_to_string(res.error()),
                           res.expected(), res.actual());
    }
}

inline std::string DeclarationResultToString(const DeclarationResult & res) {
    if(res) {
        return std::format("uniform block '{}': {} slots, {} bytes",
                           res.blockName(), res.slots().size(), res.totalSize());
    }
    if(res.error() == DeclarationError::BLOCK_NOT_FOUND) {
        return std::format("uniform block '{}' not found",
                           res.blockName().empty() ? std::string_view("<any>") : res.blockName());
    }
    return std::format("uniform block '{}', line {} column {}: error '{}' at '{}'",
                       res.blockName(), res.line(), res.column(), error_to_string(res.error()), res.token());
}

inline std::string LayoutReportToString(const LayoutReport & rep) {
    using namespace error_formatting_detail;
    if(rep.error() == LayoutError::declaration_error) {
        return std::format("Layout of '{}' not checked: {}", rep.record(), DeclarationResultToString(rep.declaration()));
    }

    std::string out;
    if(rep) {
        out = std::format("Layout of '{}' matches uniform block '{}' ({} slots)\n",
                          rep.record(), rep.declaration().blockName(), rep.schemaSlots().size());
    } else {
        out = std::format("Layout of '{}' does not match uniform block '{}': {} at slot {}\n",
                          rep.record(), rep.declaration().blockName(),
                          layout_error_to_string(rep.error()), rep.mismatchIndex());
    }
    out += slot_list("record slots", rep.schemaSlots(), rep.mismatchIndex());
    out += slot_list("declared slots", rep.declaredSlots(), rep.mismatchIndex());

    std::string renamed;
    const std::size_t n = std::min(rep.schemaSlots().size(), rep.declaredSlots().size());
    for(std::size_t i = 0; i < n; i ++) {
        if(rep.nameDiffers(i)) {
            renamed += std::format("  {:>3} {} / {}\n", i, rep.schemaSlots()[i].name, rep.declaredSlots()[i].name);
        }
    }
    if(!renamed.empty()) {
        out += " names differ (not an error):\n" + renamed;
    }
    return out;
}

inline std::string BindingResultToString(const BindingResult & res) {
    switch(res.error()) {
    case BindingError::none:
        return std::format("binding '{}' at slot {} ({}): {} bytes",
                           res.name(), res.slot(), binding_range_to_string(RangeOfSlot(res.slot())), res.expected());
    case BindingError::size_mismatch:
        return std::format("binding '{}': size mismatch, registered {} bytes, calculated {} bytes",
                           res.name(), res.expected(), res.actual());
    case BindingError::unknown_binding:
        return std::format("binding '{}' is not registered", res.name());
    case BindingError::duplicate_slot:
        return std::format("slot {} already bound to '{}'", res.slot(), res.name());
    default:
        return std::format("binding '{}' at slot {}: error '{}'",
                           res.name(), res.slot(), binding_error_to_string(res.error()));
    }
}

inline std::string BlockCheckToString(const BlockCheckResult & res) {
    std::string out = BindingResultToString(res.binding());
    if(const LayoutReport * rep = res.layout(); rep != nullptr) {
        out += "\n" + LayoutReportToString(*rep);
    } else {
        out += "\n layout validation skipped: no declaration text";
    }
    return out;
}

} // namespace UboFusion
