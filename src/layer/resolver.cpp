/// @file resolver.cpp
/// @brief Layer resolution implementation

#include <strata/layer/resolver.hpp>
#include <strata/layer/path_joiner.hpp>
#include <strata/core/log.hpp>

namespace strata_layer {

nlohmann::json ResolutionOutcome::to_json() const {
    if (!m_match) {
        return nlohmann::json{{"override", false}};
    }
    return nlohmann::json{
        {"override", true},
        {"path", m_match->path},
        {"layer", m_match->layer},
        {"layer_index", m_match->layer_index},
        {"metadata", m_match->metadata.to_json()}
    };
}

ResolutionOutcome LayerResolver::resolve(const strata_config::EffectiveConfig& config,
                                         std::string_view document_root,
                                         std::string_view request_path) const {
    if (!config.enabled) {
        return ResolutionOutcome::no_override();
    }

    auto logger = strata_core::layer_logger();

    for (std::size_t i = 0; i < config.layers.size(); ++i) {
        const auto& layer = config.layers[i];
        std::string candidate = join_layer_path(layer, document_root, request_path);

        auto metadata = m_prober.probe(candidate);
        if (!metadata) {
            logger->trace("Layer {} has no {}", layer, candidate);
            continue;
        }

        logger->debug("Layer {} overrides {} with {}", layer, request_path, candidate);
        return ResolutionOutcome::override_with(
            LayerMatch{std::move(candidate), *metadata, layer, i});
    }

    return ResolutionOutcome::no_override();
}

} // namespace strata_layer
