#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "layout.hpp"
#include "declaration.hpp"

namespace UboFusion {

// Declared slot names view into the declaration text passed to Validate.
class LayoutReport {
    LayoutError m_error = LayoutError::none;
    std::string_view m_record;
    std::vector<SlotDescr> m_schema;
    DeclarationResult m_declaration;
    std::size_t m_mismatch = no_mismatch;
public:
    static constexpr std::size_t no_mismatch = std::numeric_limits<std::size_t>::max();

    constexpr LayoutReport(LayoutError err, std::string_view record, std::vector<SlotDescr> schema,
                           DeclarationResult declaration, std::size_t mismatch):
        m_error(err), m_record(record), m_schema(std::move(schema)),
        m_declaration(std::move(declaration)), m_mismatch(mismatch)
    {}
    constexpr operator bool() const {
        return m_error == LayoutError::none;
    }
    constexpr LayoutError error() const {
        return m_error;
    }
    constexpr std::string_view record() const {
        return m_record;
    }
    constexpr const std::vector<SlotDescr> & schemaSlots() const {
        return m_schema;
    }
    constexpr const std::vector<SlotDescr> & declaredSlots() const {
        return m_declaration.slots();
    }
    constexpr const DeclarationResult & declaration() const {
        return m_declaration;
    }
    // First index whose offset or size differs, or the shorter length on a
    // count mismatch
    constexpr std::size_t mismatchIndex() const {
        return m_mismatch;
    }

    // Names never decide the outcome; reports mark them when they differ
    // ignoring case.
    constexpr bool nameDiffers(std::size_t i) const {
        if(i >= m_schema.size() || i >= declaredSlots().size()) return false;
        const std::string_view a = m_schema[i].name;
        const std::string_view b = declaredSlots()[i].name;
        if(a.size() != b.size()) return true;
        auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; };
        for(std::size_t k = 0; k < a.size(); k ++) {
            if(lower(a[k]) != lower(b[k])) return true;
        }
        return false;
    }
};


namespace validator_detail {

template<class T>
constexpr std::string_view declared_block_name() {
    using Opts = options::detail::record_opts_getter<std::remove_cvref_t<T>>;
    if constexpr (Opts::template has_option<options::detail::block_tag>) {
        return Opts::template get_option<options::detail::block_tag>::desc.toStringView();
    } else {
        return {};
    }
}

} // namespace validator_detail


/// Compares the slots of T against the uniform block blockName in text
/// (the first uniform block when blockName is empty): slot counts, and each
/// slot's offset and size, must agree position by position. The report views
/// into text, which must outlive it.
template<class T>
constexpr LayoutReport Validate(std::string_view text, std::string_view blockName) {
    constexpr auto slots = SchemaSlots<T>();
    std::vector<SlotDescr> schema(slots.begin(), slots.end());

    DeclarationResult decl = ParseDeclaration(text, blockName);
    if(!decl) {
        return LayoutReport(LayoutError::declaration_error, BlockName<T>(), std::move(schema), std::move(decl),
                            LayoutReport::no_mismatch);
    }

    const std::size_t common = std::min(schema.size(), decl.slots().size());
    for(std::size_t i = 0; i < common; i ++) {
        if(schema[i].offset != decl.slots()[i].offset) {
            return LayoutReport(LayoutError::slot_offset_mismatch, BlockName<T>(), std::move(schema), std::move(decl), i);
        }
        if(schema[i].size != decl.slots()[i].size) {
            return LayoutReport(LayoutError::slot_size_mismatch, BlockName<T>(), std::move(schema), std::move(decl), i);
        }
    }
    if(schema.size() != decl.slots().size()) {
        return LayoutReport(LayoutError::slot_count_mismatch, BlockName<T>(), std::move(schema), std::move(decl), common);
    }
    return LayoutReport(LayoutError::none, BlockName<T>(), std::move(schema), std::move(decl), LayoutReport::no_mismatch);
}

/// Same, selecting the block by T's block<> option when it has one.
template<class T>
constexpr LayoutReport Validate(std::string_view text) {
    return Validate<T>(text, validator_detail::declared_block_name<T>());
}

template<class T, class S>
    requires std::same_as<S, std::string>
LayoutReport Validate(S && text, std::string_view blockName = {}) = delete;

} // namespace UboFusion
