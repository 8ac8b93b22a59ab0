/// @file request.cpp
/// @brief Request record serialization

#include <strata/host/request.hpp>

namespace strata_host {

const char* hook_result_name(HookResult result) noexcept {
    switch (result) {
        case HookResult::Ok: return "OK";
        case HookResult::Declined: return "DECLINED";
        default: return "UNKNOWN";
    }
}

nlohmann::json RequestRec::to_json() const {
    nlohmann::json j{
        {"hostname", hostname},
        {"uri", uri},
        {"server_name", server_name},
        {"document_root", document_root},
        {"layers", layer_config.to_json()},
        {"filename", filename},
        {"exists", finfo.has_value()},
        {"notes", notes}
    };
    if (finfo) {
        j["finfo"] = finfo->to_json();
    }
    return j;
}

} // namespace strata_host
