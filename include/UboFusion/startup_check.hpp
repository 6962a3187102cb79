#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "layout.hpp"
#include "registry.hpp"
#include "validator.hpp"

namespace UboFusion {

class BlockCheckResult {
    BindingResult m_binding;
    std::optional<LayoutReport> m_layout;
public:
    constexpr BlockCheckResult(BindingResult binding, std::optional<LayoutReport> layout):
        m_binding(std::move(binding)), m_layout(std::move(layout))
    {}
    constexpr operator bool() const {
        return m_binding && (!m_layout || *m_layout);
    }
    constexpr const BindingResult & binding() const {
        return m_binding;
    }
    // nullptr when no declaration text was supplied
    constexpr const LayoutReport * layout() const {
        return m_layout ? &*m_layout : nullptr;
    }
    constexpr bool validationSkipped() const {
        return !m_layout.has_value();
    }
};

/// Start-up check of one block: its registered size against CalculateSize<T>,
/// then, when declarationText is not empty, the full layout comparison. The
/// layout report views into declarationText, which must outlive the result.
template<class T>
constexpr BlockCheckResult CheckBlock(const BindingRegistry & registry, std::string_view declarationText = {}) {
    BindingResult binding = registry.template checkBinding<T>();
    if(declarationText.empty()) {
        return BlockCheckResult(std::move(binding), std::nullopt);
    }
    return BlockCheckResult(std::move(binding), Validate<T>(declarationText));
}

template<class T, class S>
    requires std::same_as<S, std::string>
BlockCheckResult CheckBlock(const BindingRegistry & registry, S && declarationText) = delete;

} // namespace UboFusion
