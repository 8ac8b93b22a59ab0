#pragma once

/// @file scope_config.hpp
/// @brief Per-scope layer configuration and scope merging
///
/// A ScopeConfig holds what one configuration scope (main server, virtual
/// host, location section) declared itself. EffectiveConfig is what applies
/// to a request after every enclosing scope has been merged in, outermost
/// first. Both are immutable once configuration load completes and may be
/// read from any number of request workers without synchronization.

#include "fwd.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata_config {

// =============================================================================
// ScopeConfig
// =============================================================================

/// Settings declared locally in one scope
struct ScopeConfig {
    std::optional<bool> enabled;      ///< Unset when EnableDocumentRootLayers was not used here
    std::vector<std::string> layers;  ///< Declaration order, duplicates kept

    /// True when neither directive was used in this scope
    [[nodiscard]] bool empty() const noexcept {
        return !enabled.has_value() && layers.empty();
    }
};

// =============================================================================
// EffectiveConfig
// =============================================================================

/// Settings applicable to a request scope
struct EffectiveConfig {
    bool enabled = false;
    std::vector<std::string> layers;

    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const EffectiveConfig& other) const {
        return enabled == other.enabled && layers == other.layers;
    }
    bool operator!=(const EffectiveConfig& other) const { return !(*this == other); }
};

// =============================================================================
// Merging
// =============================================================================

/// Merge a descendant scope into its ancestor's effective configuration.
///
/// Shallow field override: a declared `enabled` wins, and a non-empty
/// `layers` list replaces the ancestor's list entirely instead of extending it.
[[nodiscard]] EffectiveConfig merge(const EffectiveConfig& parent, const ScopeConfig& child);

/// Fold a chain of scopes, outermost first, starting from the defaults
[[nodiscard]] EffectiveConfig merge_chain(const std::vector<const ScopeConfig*>& scopes);

} // namespace strata_config
