/// @file server.cpp
/// @brief Host server implementation

#include <strata/host/server.hpp>
#include <strata/config/config_parser.hpp>
#include <strata/layer/path_joiner.hpp>
#include <strata/core/log.hpp>

namespace strata_host {

Server::Server(std::unique_ptr<strata_layer::FileProber> prober)
    : m_prober(std::move(prober)) {
    if (!m_prober) {
        m_prober = std::make_unique<strata_layer::FilesystemProber>();
    }
}

// =============================================================================
// Configuration
// =============================================================================

strata_core::Result<void> Server::load_config(const strata_config::DirectiveTree& tree) {
    HostConfigBuilder builder(m_commands);
    auto built = builder.build(tree);
    if (!built) {
        return strata_core::Err(built.error());
    }
    m_config = std::move(built).value();
    return strata_core::Ok();
}

strata_core::Result<void> Server::load_config_string(std::string_view text, const std::string& source) {
    strata_config::ConfigParser parser;
    auto tree = parser.parse_string(text, source);
    if (!tree) {
        return strata_core::Err(tree.error());
    }
    return load_config(tree.value());
}

strata_core::Result<void> Server::load_config_file(const std::filesystem::path& path) {
    strata_config::ConfigParser parser;
    auto tree = parser.parse_file(path);
    if (!tree) {
        return strata_core::Err(tree.error());
    }
    return load_config(tree.value());
}

// =============================================================================
// Request Processing
// =============================================================================

RequestRec Server::make_request(std::string_view host, std::string_view uri) const {
    RequestRec request;
    request.hostname = std::string(host);
    request.uri = std::string(uri);

    if (!m_config) {
        request.document_root = kDefaultDocumentRoot;
        return request;
    }

    const auto* vhost = m_config->select_virtual_host(host);
    request.server_name = vhost ? vhost->server_name : m_config->server_name;
    request.document_root = m_config->document_root_for(vhost);
    request.layer_config = m_config->effective_for(vhost, uri);
    return request;
}

void Server::process(RequestRec& request) const {
    auto logger = strata_core::host_logger();

    if (m_pipeline.run_translate(request) == HookResult::Declined) {
        logger->trace("translate declined for {}", request.uri);
    }

    if (m_pipeline.run_map_to_storage(request) == HookResult::Declined) {
        map_to_storage_default(request);
    }

    logger->debug("{}{} -> {} ({})", request.hostname, request.uri, request.filename,
        request.finfo ? strata_layer::file_type_name(request.finfo->type) : "missing");
}

RequestRec Server::handle(std::string_view host, std::string_view uri) const {
    RequestRec request = make_request(host, uri);
    process(request);
    return request;
}

void Server::map_to_storage_default(RequestRec& request) const {
    if (request.filename.empty()) {
        request.filename = strata_layer::canonicalize(request.document_root + "/" + request.uri);
        request.finfo.reset();
    }
    if (!request.finfo) {
        request.finfo = m_prober->probe(request.filename);
    }
}

} // namespace strata_host
