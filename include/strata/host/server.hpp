#pragma once

/// @file server.hpp
/// @brief Minimal host server: command table, configuration, pipeline
///
/// Startup order:
/// 1. construct the Server (optionally with a custom FileProber)
/// 2. register modules, which add commands and phase handlers
/// 3. load the configuration; any error aborts startup
/// 4. handle requests, from as many threads as needed

#include "fwd.hpp"
#include "host_config.hpp"
#include "pipeline.hpp"
#include "request.hpp"
#include <strata/config/command.hpp>
#include <strata/config/directive.hpp>
#include <strata/core/error.hpp>
#include <strata/layer/prober.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace strata_host {

class Server {
public:
    explicit Server(std::unique_ptr<strata_layer::FileProber> prober =
                        std::make_unique<strata_layer::FilesystemProber>());

    // Non-copyable, non-movable: registered handlers refer back to it
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    // =========================================================================
    // Startup
    // =========================================================================

    [[nodiscard]] strata_config::CommandRegistry& commands() noexcept { return m_commands; }
    [[nodiscard]] const strata_config::CommandRegistry& commands() const noexcept { return m_commands; }

    [[nodiscard]] RequestPipeline& pipeline() noexcept { return m_pipeline; }
    [[nodiscard]] const RequestPipeline& pipeline() const noexcept { return m_pipeline; }

    [[nodiscard]] const strata_layer::FileProber& prober() const noexcept { return *m_prober; }

    [[nodiscard]] strata_core::Result<void> load_config(const strata_config::DirectiveTree& tree);
    [[nodiscard]] strata_core::Result<void> load_config_string(std::string_view text,
                                                               const std::string& source = "<string>");
    [[nodiscard]] strata_core::Result<void> load_config_file(const std::filesystem::path& path);

    [[nodiscard]] bool is_loaded() const noexcept { return m_config.has_value(); }

    /// Loaded configuration; only valid once is_loaded()
    [[nodiscard]] const HostConfig& config() const { return *m_config; }

    // =========================================================================
    // Requests
    // =========================================================================

    /// Select the scope for a request and fill in its document root and
    /// effective layer configuration
    [[nodiscard]] RequestRec make_request(std::string_view host, std::string_view uri) const;

    /// Run the translate and map-to-storage phases
    void process(RequestRec& request) const;

    /// make_request followed by process
    [[nodiscard]] RequestRec handle(std::string_view host, std::string_view uri) const;

private:
    /// Fallback mapping once every map-to-storage handler declined
    void map_to_storage_default(RequestRec& request) const;

    std::unique_ptr<strata_layer::FileProber> m_prober;
    strata_config::CommandRegistry m_commands;
    RequestPipeline m_pipeline;
    std::optional<HostConfig> m_config;
};

} // namespace strata_host
