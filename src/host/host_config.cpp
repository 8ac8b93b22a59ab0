/// @file host_config.cpp
/// @brief Host scope tree construction

#include <strata/host/host_config.hpp>
#include <strata/layer/path_joiner.hpp>
#include <strata/core/log.hpp>

namespace strata_host {

namespace {

using strata_config::DirectiveOccurrence;
using strata_config::names_equal;
using strata_core::ConfigError;

std::string_view strip_port(std::string_view host) {
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        return close == std::string_view::npos ? host : host.substr(0, close + 1);
    }
    auto colon = host.rfind(':');
    return colon == std::string_view::npos ? host : host.substr(0, colon);
}

strata_core::Result<void> located(ConfigError err, const DirectiveOccurrence& node) {
    err.at(node.location.file, node.location.line);
    return strata_core::Err(std::move(err));
}

bool is_filesystem_section(const DirectiveOccurrence& node) {
    return node.is("<Directory") || node.is("<DirectoryMatch") ||
           node.is("<Files") || node.is("<FilesMatch");
}

} // anonymous namespace

// =============================================================================
// Scope Matching
// =============================================================================

bool LocationScope::matches(std::string_view uri) const {
    if (is_regex) {
        return std::regex_search(uri.begin(), uri.end(), regex);
    }
    if (pattern.empty() || uri.size() < pattern.size()) {
        return false;
    }
    if (uri.substr(0, pattern.size()) != pattern) {
        return false;
    }
    if (uri.size() == pattern.size()) {
        return true;
    }
    return pattern.back() == '/' || uri[pattern.size()] == '/';
}

bool VirtualHostScope::answers_to(std::string_view host) const {
    auto name = strip_port(host);
    if (name.empty()) {
        return false;
    }
    if (!server_name.empty() && names_equal(strip_port(server_name), name)) {
        return true;
    }
    for (const auto& alias : aliases) {
        if (names_equal(alias, name)) {
            return true;
        }
    }
    return false;
}

const VirtualHostScope* HostConfig::select_virtual_host(std::string_view host) const {
    if (virtual_hosts.empty()) {
        return nullptr;
    }
    for (const auto& vhost : virtual_hosts) {
        if (vhost.answers_to(host)) {
            return &vhost;
        }
    }
    return &virtual_hosts.front();
}

strata_config::EffectiveConfig HostConfig::effective_for(const VirtualHostScope* vhost,
                                                         std::string_view uri) const {
    strata_config::EffectiveConfig result = vhost ? vhost->effective : effective;

    for (const auto& loc : locations) {
        if (loc.matches(uri)) {
            result = strata_config::merge(result, loc.layers);
        }
    }
    if (vhost) {
        for (const auto& loc : vhost->locations) {
            if (loc.matches(uri)) {
                result = strata_config::merge(result, loc.layers);
            }
        }
    }
    return result;
}

const std::string& HostConfig::document_root_for(const VirtualHostScope* vhost) const {
    return vhost ? vhost->effective_document_root : document_root;
}

// =============================================================================
// HostConfigBuilder
// =============================================================================

strata_core::Result<HostConfig> HostConfigBuilder::build(const strata_config::DirectiveTree& tree) const {
    HostConfig config;

    WalkState state{ScopeKind::Server, &config.layers, nullptr, &config.locations};
    auto walked = walk(tree.top_level, state, config);
    if (!walked) {
        return strata_core::Err<HostConfig>(walked.error());
    }

    config.effective = strata_config::merge_chain({&config.layers});
    for (auto& vhost : config.virtual_hosts) {
        vhost.effective = strata_config::merge_chain({&config.layers, &vhost.layers});
        vhost.effective_document_root = vhost.document_root.value_or(config.document_root);
    }

    strata_core::config_logger()->info(
        "Loaded {}: {} virtual host(s), layers {} on main server",
        tree.source, config.virtual_hosts.size(), config.effective.enabled ? "enabled" : "disabled");

    return strata_core::Ok(std::move(config));
}

strata_core::Result<void> HostConfigBuilder::walk(
    const std::vector<std::unique_ptr<DirectiveOccurrence>>& nodes,
    const WalkState& state,
    HostConfig& config) const {

    for (const auto& node : nodes) {
        auto result = node->is_section()
            ? apply_section(*node, state, config)
            : apply_directive(*node, state, config);
        if (!result) {
            return result;
        }
    }
    return strata_core::Ok();
}

strata_core::Result<void> HostConfigBuilder::apply_section(
    const DirectiveOccurrence& node,
    const WalkState& state,
    HostConfig& config) const {

    auto logger = strata_core::config_logger();

    if (node.is("<VirtualHost")) {
        if (state.kind != ScopeKind::Server) {
            return located(ConfigError::not_allowed_here(node.name), node);
        }
        if (node.args.empty()) {
            return located(ConfigError::requires_arguments(node.name, "<VirtualHost addr[:port] ...>"), node);
        }

        VirtualHostScope vhost;
        vhost.addresses = node.args;
        vhost.location = node.location;

        WalkState inner{ScopeKind::VirtualHost, &vhost.layers, &vhost, &vhost.locations};
        auto result = walk(node.children, inner, config);
        if (!result) {
            return result;
        }

        logger->debug("VirtualHost {} with {} location section(s) at line {}",
            vhost.server_name.empty() ? vhost.addresses.front() : vhost.server_name,
            vhost.locations.size(), node.location.line);
        config.virtual_hosts.push_back(std::move(vhost));
        return strata_core::Ok();
    }

    if (node.is("<Location") || node.is("<LocationMatch")) {
        if (state.kind != ScopeKind::Server && state.kind != ScopeKind::VirtualHost) {
            return located(ConfigError::not_allowed_here(node.name), node);
        }

        LocationScope loc;
        loc.location = node.location;
        loc.is_regex = node.is("<LocationMatch");

        if (!loc.is_regex && node.args.size() == 2 && node.args.front() == "~") {
            loc.is_regex = true;
            loc.pattern = node.args[1];
        } else if (node.args.size() == 1) {
            loc.pattern = node.args.front();
        } else {
            return located(ConfigError::takes_one_argument(node.name, node.name + " path>"), node);
        }

        if (loc.is_regex) {
            try {
                loc.regex = std::regex(loc.pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& ex) {
                return located(ConfigError::syntax(
                    "Regular expression could not be compiled: " + loc.pattern + " (" + ex.what() + ")"), node);
            }
        }

        WalkState inner{ScopeKind::Location, &loc.layers, state.vhost, nullptr};
        auto result = walk(node.children, inner, config);
        if (!result) {
            return result;
        }

        logger->debug("{} {} at line {}", node.name, loc.pattern, node.location.line);
        state.locations->push_back(std::move(loc));
        return strata_core::Ok();
    }

    if (is_filesystem_section(node)) {
        // Contents are validated by their own handlers but carry no request
        // semantics here
        strata_config::ScopeConfig discarded;
        WalkState inner{ScopeKind::Filesystem, &discarded, state.vhost, nullptr};
        return walk(node.children, inner, config);
    }

    // Conditional and other unknown sections are read as if their contents
    // sat in the enclosing scope
    logger->debug("Treating section {}> at {}:{} as transparent",
        node.name, node.location.file, node.location.line);
    return walk(node.children, state, config);
}

strata_core::Result<void> HostConfigBuilder::apply_directive(
    const DirectiveOccurrence& node,
    const WalkState& state,
    HostConfig& config) const {

    const bool server_scope = state.kind == ScopeKind::Server || state.kind == ScopeKind::VirtualHost;

    if (node.is("DocumentRoot")) {
        if (!server_scope) {
            return located(ConfigError::not_allowed_here(node.name), node);
        }
        if (node.args.size() != 1) {
            return located(ConfigError::takes_one_argument(node.name, "DocumentRoot directory"), node);
        }
        std::string root = strata_layer::canonicalize(node.args.front());
        if (state.vhost) {
            state.vhost->document_root = std::move(root);
        } else {
            config.document_root = std::move(root);
        }
        return strata_core::Ok();
    }

    if (node.is("ServerName")) {
        if (!server_scope) {
            return located(ConfigError::not_allowed_here(node.name), node);
        }
        if (node.args.size() != 1) {
            return located(ConfigError::takes_one_argument(node.name, "ServerName hostname[:port]"), node);
        }
        if (state.vhost) {
            state.vhost->server_name = node.args.front();
        } else {
            config.server_name = node.args.front();
        }
        return strata_core::Ok();
    }

    if (node.is("ServerAlias")) {
        if (state.kind != ScopeKind::VirtualHost) {
            return located(ConfigError::not_allowed_here(node.name), node);
        }
        if (node.args.empty()) {
            return located(ConfigError::requires_arguments(node.name, "ServerAlias name [name ...]"), node);
        }
        state.vhost->aliases.insert(state.vhost->aliases.end(), node.args.begin(), node.args.end());
        return strata_core::Ok();
    }

    if (const auto* spec = m_commands.find(node.name)) {
        return m_commands.invoke(*spec, node, *state.layers);
    }

    strata_core::config_logger()->warn("Skipping unknown directive {} at {}:{}",
        node.name, node.location.file, node.location.line);
    return strata_core::Ok();
}

} // namespace strata_host
