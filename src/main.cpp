/// @file main.cpp
/// @brief strata_resolve entry point - loads a host configuration and
/// reports how request paths map to files
///
/// Startup mirrors a server start: settings are read, logging configured,
/// the layer module registered and the host configuration loaded. Any
/// configuration error aborts with the error chain and exit code 1.

#include <strata/core/error.hpp>
#include <strata/core/log.hpp>
#include <strata/host/server.hpp>
#include <strata/module/layer_module.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// =============================================================================
// Settings
// =============================================================================

struct Settings {
    fs::path config_file;
    strata_core::LogConfig logging;
    bool valid = true;
    std::string error;
};

Settings load_settings(const fs::path& settings_path) {
    Settings settings;
    settings.logging.level = spdlog::level::warn;

    if (settings_path.empty()) {
        return settings;
    }

    if (!fs::exists(settings_path)) {
        settings.valid = false;
        settings.error = "Settings file not found: " + settings_path.string();
        return settings;
    }

    try {
        auto tbl = toml::parse_file(settings_path.string());

        if (auto log = tbl["logging"].as_table()) {
            auto level_name = (*log)["level"].value_or<std::string>("warn");
            auto level = strata_core::parse_log_level(level_name);
            if (!level) {
                settings.valid = false;
                settings.error = "Unknown log level in settings: " + level_name;
                return settings;
            }
            settings.logging.level = *level;
            settings.logging.console_enabled = (*log)["console"].value_or(true);
            settings.logging.file_enabled = (*log)["file"].value_or(false);
            settings.logging.log_directory = (*log)["directory"].value_or<std::string>("");
        }

        if (auto server = tbl["server"].as_table()) {
            auto config = (*server)["config"].value_or<std::string>("");
            if (!config.empty()) {
                fs::path config_path(config);
                // Relative paths are taken from the settings file's directory
                if (config_path.is_relative()) {
                    config_path = settings_path.parent_path() / config_path;
                }
                settings.config_file = config_path;
            }
        }
    } catch (const toml::parse_error& err) {
        settings.valid = false;
        settings.error = "Failed to parse settings: " + std::string(err.what());
    }

    return settings;
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] [URI...]\n"
              << "\n"
              << "Arguments:\n"
              << "  URI                 Request path to resolve, e.g. /banner.png\n"
              << "\n"
              << "Options:\n"
              << "  --settings FILE     TOML settings ([logging], [server])\n"
              << "  --config FILE       Host configuration file\n"
              << "  --host NAME         Host header used to select a virtual host\n"
              << "  --json              Print request records as JSON\n"
              << "  --check             Validate the configuration and exit\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, off\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --config conf/httpd.conf --check\n"
              << "  " << program_name << " --config conf/httpd.conf --host www.example.com /banner.png\n";
}

void print_version() {
    std::cout << "strata_resolve 0.1.0\n"
              << "document root layering\n";
}

void print_plain(const strata_host::RequestRec& request) {
    std::cout << request.uri << " -> " << request.filename;
    if (!request.finfo) {
        std::cout << " (not found)";
    } else if (const auto* layer = request.note(strata_module::kLayerNote)) {
        std::cout << " (layer " << *layer << ")";
    } else {
        std::cout << " (document root)";
    }
    std::cout << "\n";
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path settings_path;
    fs::path config_override;
    std::string host;
    std::string level_override;
    bool json_output = false;
    bool check_only = false;
    std::vector<std::string> uris;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* option) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << option << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "--check") {
            check_only = true;
        } else if (arg == "--settings" || arg == "--config" || arg == "--host" || arg == "--log-level") {
            const char* value = next_value(arg.c_str());
            if (!value) {
                return 1;
            }
            if (arg == "--settings") settings_path = value;
            else if (arg == "--config") config_override = value;
            else if (arg == "--host") host = value;
            else level_override = value;
        } else if (!arg.empty() && arg[0] != '-') {
            uris.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto settings = load_settings(settings_path);
    if (!settings.valid) {
        std::cerr << settings.error << "\n";
        return 1;
    }

    if (!level_override.empty()) {
        auto level = strata_core::parse_log_level(level_override);
        if (!level) {
            std::cerr << "Unknown log level: " << level_override << "\n";
            return 1;
        }
        settings.logging.level = *level;
    }
    if (!config_override.empty()) {
        settings.config_file = config_override;
    }

    strata_core::init_logging();
    strata_core::configure_logging(settings.logging);

    if (settings.config_file.empty()) {
        std::cerr << "Error: No configuration specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    STRATA_LOG_DEBUG("Loading configuration from {}", settings.config_file.string());

    strata_host::Server server;
    auto registered = strata_module::register_layer_module(server);
    if (!registered) {
        std::cerr << strata_core::build_error_chain(registered.error()) << "\n";
        return 1;
    }

    auto loaded = server.load_config_file(settings.config_file);
    if (!loaded) {
        std::cerr << strata_core::build_error_chain(loaded.error()) << "\n";
        strata_core::shutdown_logging();
        return 1;
    }

    STRATA_LOG_INFO("Configuration {} loaded, {} virtual host(s)",
        settings.config_file.string(), server.config().virtual_hosts.size());

    if (check_only) {
        std::cout << "Syntax OK\n";
        strata_core::shutdown_logging();
        return 0;
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto& uri : uris) {
        auto request = server.handle(host, uri);
        if (json_output) {
            results.push_back(request.to_json());
        } else {
            print_plain(request);
        }
    }

    if (json_output) {
        std::cout << results.dump(2) << "\n";
    }

    strata_core::shutdown_logging();
    return 0;
}
