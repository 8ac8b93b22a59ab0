#pragma once

/// @file resolver.hpp
/// @brief Per-request layer resolution
///
/// The LayerResolver walks the effective layer list of a request scope in
/// declaration order and returns the first candidate that exists. Earlier
/// layers win over later ones and over the document root itself. It holds
/// no mutable state; one instance can serve any number of concurrent
/// requests as long as the prober is thread-safe.

#include "fwd.hpp"
#include "prober.hpp"
#include <strata/config/scope_config.hpp>

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace strata_layer {

// =============================================================================
// ResolutionOutcome
// =============================================================================

/// The candidate that won
struct LayerMatch {
    std::string path;          ///< Canonical candidate path
    FileMetadata metadata;
    std::string layer;         ///< Layer entry as configured
    std::size_t layer_index = 0;
};

/// Override(path, metadata) or NoOverride
class ResolutionOutcome {
public:
    [[nodiscard]] static ResolutionOutcome no_override() {
        return ResolutionOutcome{};
    }

    [[nodiscard]] static ResolutionOutcome override_with(LayerMatch match) {
        ResolutionOutcome outcome;
        outcome.m_match = std::move(match);
        return outcome;
    }

    [[nodiscard]] bool is_override() const noexcept { return m_match.has_value(); }
    explicit operator bool() const noexcept { return m_match.has_value(); }

    /// The winning candidate, or nullptr for NoOverride
    [[nodiscard]] const LayerMatch* match() const noexcept {
        return m_match ? &*m_match : nullptr;
    }

    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::optional<LayerMatch> m_match;
};

// =============================================================================
// LayerResolver
// =============================================================================

class LayerResolver {
public:
    explicit LayerResolver(const FileProber& prober) : m_prober(prober) {}

    /// Decide whether `request_path` is served from a layer.
    ///
    /// Disabled configurations return NoOverride without touching the
    /// filesystem. Probe failures skip the layer; they are never errors.
    [[nodiscard]] ResolutionOutcome resolve(const strata_config::EffectiveConfig& config,
                                            std::string_view document_root,
                                            std::string_view request_path) const;

private:
    const FileProber& m_prober;
};

} // namespace strata_layer
