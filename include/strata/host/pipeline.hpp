#pragma once

/// @file pipeline.hpp
/// @brief Request pipeline phases modules hook into
///
/// Two phases matter for file mapping:
/// - translate: decides routing; handlers run in registration order until
///   one returns HookResult::Ok
/// - map-to-storage: finalizes filename and metadata; handlers deferred on
///   the request run first, then the registered ones, until one returns Ok
///
/// Handlers are appended, never replaced, so several modules can share a
/// phase. Registration happens at startup; running the phases is const and
/// safe from concurrent request workers.

#include "fwd.hpp"
#include "request.hpp"

#include <string>
#include <vector>

namespace strata_host {

class RequestPipeline {
public:
    RequestPipeline() = default;

    void add_translate_handler(std::string name, RequestHandler handler);
    void add_map_to_storage_handler(std::string name, RequestHandler handler);

    /// Check if a handler with this name is hooked into either phase
    [[nodiscard]] bool has_handler(const std::string& name) const noexcept;

    [[nodiscard]] HookResult run_translate(RequestRec& request) const;

    /// Consumes the handlers deferred on the request
    [[nodiscard]] HookResult run_map_to_storage(RequestRec& request) const;

    [[nodiscard]] std::size_t translate_handler_count() const noexcept { return m_translate.size(); }
    [[nodiscard]] std::size_t map_to_storage_handler_count() const noexcept { return m_map_to_storage.size(); }

private:
    struct NamedHandler {
        std::string name;
        RequestHandler handler;
    };

    std::vector<NamedHandler> m_translate;
    std::vector<NamedHandler> m_map_to_storage;
};

} // namespace strata_host
