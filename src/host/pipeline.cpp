/// @file pipeline.cpp
/// @brief Request pipeline implementation

#include <strata/host/pipeline.hpp>
#include <strata/core/log.hpp>

namespace strata_host {

void RequestPipeline::add_translate_handler(std::string name, RequestHandler handler) {
    m_translate.push_back(NamedHandler{std::move(name), std::move(handler)});
}

void RequestPipeline::add_map_to_storage_handler(std::string name, RequestHandler handler) {
    m_map_to_storage.push_back(NamedHandler{std::move(name), std::move(handler)});
}

bool RequestPipeline::has_handler(const std::string& name) const noexcept {
    for (const auto& h : m_translate) {
        if (h.name == name) return true;
    }
    for (const auto& h : m_map_to_storage) {
        if (h.name == name) return true;
    }
    return false;
}

HookResult RequestPipeline::run_translate(RequestRec& request) const {
    for (const auto& h : m_translate) {
        auto result = h.handler(request);
        strata_core::host_logger()->trace("translate {} for {}: {}",
            h.name, request.uri, hook_result_name(result));
        if (result == HookResult::Ok) {
            return HookResult::Ok;
        }
    }
    return HookResult::Declined;
}

HookResult RequestPipeline::run_map_to_storage(RequestRec& request) const {
    auto deferred = std::move(request.map_to_storage_handlers);
    request.map_to_storage_handlers.clear();

    for (auto& handler : deferred) {
        if (handler(request) == HookResult::Ok) {
            return HookResult::Ok;
        }
    }
    for (const auto& h : m_map_to_storage) {
        if (h.handler(request) == HookResult::Ok) {
            strata_core::host_logger()->trace("map_to_storage handled by {}", h.name);
            return HookResult::Ok;
        }
    }
    return HookResult::Declined;
}

} // namespace strata_host
