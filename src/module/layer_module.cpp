/// @file layer_module.cpp
/// @brief Document-root layering module

#include <strata/module/layer_module.hpp>
#include <strata/config/context_validator.hpp>
#include <strata/host/server.hpp>
#include <strata/layer/resolver.hpp>
#include <strata/core/log.hpp>

namespace strata_module {

namespace {

strata_core::Result<void> add_layer(const strata_config::DirectiveOccurrence& occurrence,
                                    strata_config::ScopeConfig& scope,
                                    const std::string& path) {
    auto placed = strata_config::validate_context(occurrence);
    if (!placed) {
        return placed;
    }

    scope.layers.push_back(path);
    return strata_core::Ok();
}

strata_core::Result<void> set_enabled(const strata_config::DirectiveOccurrence& occurrence,
                                      strata_config::ScopeConfig& scope,
                                      const std::string& flag) {
    auto placed = strata_config::validate_context(occurrence);
    if (!placed) {
        return placed;
    }

    if (flag != "On" && flag != "Off") {
        auto err = strata_core::ConfigError::invalid_value(occurrence.name, kEnableUsage, flag);
        err.at(occurrence.location.file, occurrence.location.line);
        return strata_core::Err(std::move(err));
    }

    scope.enabled = (flag == "On");
    return strata_core::Ok();
}

} // anonymous namespace

std::vector<strata_config::CommandSpec> layer_commands() {
    return {
        strata_config::CommandSpec{
            kLayersDirective, strata_config::ArgsHow::Iterate, kLayersUsage, &add_layer},
        strata_config::CommandSpec{
            kEnableDirective, strata_config::ArgsHow::Take1, kEnableUsage, &set_enabled},
    };
}

strata_host::HookResult translate_layers(strata_host::RequestRec& request,
                                         const strata_layer::FileProber& prober) {
    if (!request.layer_config.enabled) {
        return strata_host::HookResult::Declined;
    }

    request.push_map_to_storage_handler([&prober](strata_host::RequestRec& r) {
        return map_layers_to_storage(r, prober);
    });
    return strata_host::HookResult::Declined;
}

strata_host::HookResult map_layers_to_storage(strata_host::RequestRec& request,
                                              const strata_layer::FileProber& prober) {
    strata_layer::LayerResolver resolver(prober);
    auto outcome = resolver.resolve(request.layer_config, request.document_root, request.uri);

    if (const auto* match = outcome.match()) {
        request.filename = match->path;
        request.finfo = match->metadata;
        request.notes[kLayerNote] = match->layer;
    }
    return strata_host::HookResult::Declined;
}

strata_core::Result<void> register_layer_module(strata_host::Server& server) {
    for (auto& spec : layer_commands()) {
        auto added = server.commands().add(std::move(spec));
        if (!added) {
            return added;
        }
    }

    const auto& prober = server.prober();
    server.pipeline().add_translate_handler(kModuleName, [&prober](strata_host::RequestRec& r) {
        return translate_layers(r, prober);
    });

    strata_core::config_logger()->debug("Registered module {}", kModuleName);
    return strata_core::Ok();
}

} // namespace strata_module
