#pragma once

/// @file host_config.hpp
/// @brief Host scope tree built from a parsed configuration
///
/// The host understands a small core vocabulary (DocumentRoot, ServerName,
/// ServerAlias and the VirtualHost/Location/Directory/Files sections) and
/// hands every other directive to the module command table. Directives it
/// knows nothing about are skipped with a warning.

#include "fwd.hpp"
#include <strata/config/command.hpp>
#include <strata/config/directive.hpp>
#include <strata/config/scope_config.hpp>
#include <strata/core/error.hpp>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace strata_host {

/// DocumentRoot used when the configuration sets none
inline constexpr const char* kDefaultDocumentRoot = "/usr/local/apache2/htdocs";

// =============================================================================
// Scopes
// =============================================================================

/// A <Location> or <LocationMatch> section
struct LocationScope {
    std::string pattern;
    bool is_regex = false;
    std::regex regex;
    strata_config::ScopeConfig layers;
    strata_config::SourceLocation location;

    /// Prefix match on whole path segments, or unanchored regex search
    [[nodiscard]] bool matches(std::string_view uri) const;
};

/// A <VirtualHost> section
struct VirtualHostScope {
    std::vector<std::string> addresses;
    std::string server_name;
    std::vector<std::string> aliases;
    std::optional<std::string> document_root;
    strata_config::ScopeConfig layers;
    std::vector<LocationScope> locations;
    strata_config::SourceLocation location;

    // Derived once the whole configuration is read
    std::string effective_document_root;
    strata_config::EffectiveConfig effective;

    /// Match ServerName or any ServerAlias, ignoring case and port
    [[nodiscard]] bool answers_to(std::string_view host) const;
};

// =============================================================================
// HostConfig
// =============================================================================

/// Fully loaded host configuration; read-only after the builder returns it
struct HostConfig {
    std::string server_name;
    std::string document_root = kDefaultDocumentRoot;
    strata_config::ScopeConfig layers;
    std::vector<LocationScope> locations;
    std::vector<VirtualHostScope> virtual_hosts;

    strata_config::EffectiveConfig effective;

    /// Name-based selection; falls back to the first virtual host, or to the
    /// main server (nullptr) when there are none
    [[nodiscard]] const VirtualHostScope* select_virtual_host(std::string_view host) const;

    /// Effective layer configuration of a request: the pre-merged server or
    /// virtual host scope, then every matching location in order (main
    /// server sections first)
    [[nodiscard]] strata_config::EffectiveConfig effective_for(const VirtualHostScope* vhost,
                                                               std::string_view uri) const;

    /// Document root of the server or virtual host
    [[nodiscard]] const std::string& document_root_for(const VirtualHostScope* vhost) const;
};

// =============================================================================
// HostConfigBuilder
// =============================================================================

/// Walks a directive tree into a HostConfig, dispatching module directives
/// through the command registry
class HostConfigBuilder {
public:
    explicit HostConfigBuilder(const strata_config::CommandRegistry& commands)
        : m_commands(commands) {}

    [[nodiscard]] strata_core::Result<HostConfig> build(const strata_config::DirectiveTree& tree) const;

private:
    enum class ScopeKind : std::uint8_t {
        Server,
        VirtualHost,
        Location,
        Filesystem,
    };

    struct WalkState {
        ScopeKind kind;
        strata_config::ScopeConfig* layers;
        VirtualHostScope* vhost;
        std::vector<LocationScope>* locations;
    };

    [[nodiscard]] strata_core::Result<void> walk(
        const std::vector<std::unique_ptr<strata_config::DirectiveOccurrence>>& nodes,
        const WalkState& state,
        HostConfig& config) const;

    [[nodiscard]] strata_core::Result<void> apply_section(
        const strata_config::DirectiveOccurrence& node,
        const WalkState& state,
        HostConfig& config) const;

    [[nodiscard]] strata_core::Result<void> apply_directive(
        const strata_config::DirectiveOccurrence& node,
        const WalkState& state,
        HostConfig& config) const;

    const strata_config::CommandRegistry& m_commands;
};

} // namespace strata_host
