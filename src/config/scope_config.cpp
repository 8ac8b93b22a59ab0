/// @file scope_config.cpp
/// @brief Scope merge implementation

#include <strata/config/scope_config.hpp>

namespace strata_config {

nlohmann::json EffectiveConfig::to_json() const {
    return nlohmann::json{
        {"enabled", enabled},
        {"layers", layers}
    };
}

EffectiveConfig merge(const EffectiveConfig& parent, const ScopeConfig& child) {
    EffectiveConfig result = parent;

    if (child.enabled.has_value()) {
        result.enabled = *child.enabled;
    }
    if (!child.layers.empty()) {
        result.layers = child.layers;
    }

    return result;
}

EffectiveConfig merge_chain(const std::vector<const ScopeConfig*>& scopes) {
    EffectiveConfig result;
    for (const auto* scope : scopes) {
        if (scope) {
            result = merge(result, *scope);
        }
    }
    return result;
}

} // namespace strata_config
