#pragma once

/// @file request.hpp
/// @brief Per-request record passed through the pipeline phases

#include "fwd.hpp"
#include <strata/config/scope_config.hpp>
#include <strata/layer/prober.hpp>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata_host {

/// Outcome of a phase handler
enum class HookResult : std::uint8_t {
    Ok,        ///< Handled; later handlers of the phase are skipped
    Declined,  ///< Not handled; the phase continues
};

/// Get hook result name
[[nodiscard]] const char* hook_result_name(HookResult result) noexcept;

using RequestHandler = std::function<HookResult(RequestRec&)>;

// =============================================================================
// RequestRec
// =============================================================================

/// State of one request. Created by the server, owned by the caller and
/// never shared between requests.
struct RequestRec {
    // Inputs
    std::string hostname;
    std::string uri;

    // Filled by scope selection
    std::string server_name;
    std::string document_root;
    strata_config::EffectiveConfig layer_config;

    // Filled by map-to-storage
    std::string filename;
    std::optional<strata_layer::FileMetadata> finfo;

    /// Free-form annotations left by handlers
    std::map<std::string, std::string> notes;

    /// Handlers deferred to this request's map-to-storage phase, run
    /// before the globally registered ones
    std::vector<RequestHandler> map_to_storage_handlers;

    /// Defer a handler to this request's map-to-storage phase
    void push_map_to_storage_handler(RequestHandler handler) {
        map_to_storage_handlers.push_back(std::move(handler));
    }

    /// Look up a note
    [[nodiscard]] const std::string* note(const std::string& key) const {
        auto it = notes.find(key);
        return it != notes.end() ? &it->second : nullptr;
    }

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace strata_host
