#pragma once

/// @file layer_module.hpp
/// @brief Document-root layering hooked into the host server
///
/// Directives (server config, virtual host, <Location*>):
///
///     EnableDocumentRootLayers On|Off
///     DocumentRootLayers dir-path1 [dir-path2 ... dir-pathN]
///
/// Relative layer paths hang off the DocumentRoot of the request's scope.
/// Layers are searched in the order given; the first one holding the
/// requested path is used, otherwise the DocumentRoot mapping applies.
///
/// Example:
///
///     DocumentRoot "/usr/local/htdocs"
///     EnableDocumentRootLayers On
///     DocumentRootLayers layered/christmas layered/promotions
///
///     <VirtualHost *:80>
///         DocumentRoot "/usr/local/vhost2"
///         EnableDocumentRootLayers Off
///         <LocationMatch "\.png$">
///             EnableDocumentRootLayers On
///             DocumentRootLayers images_v3 images_v2
///         </LocationMatch>
///     </VirtualHost>

#include <strata/config/command.hpp>
#include <strata/core/error.hpp>
#include <strata/host/request.hpp>
#include <strata/layer/prober.hpp>

#include <vector>

namespace strata_host {
class Server;
}

namespace strata_module {

inline constexpr const char* kModuleName = "strata_layer";

/// Request note naming the layer entry that served the request
inline constexpr const char* kLayerNote = "document-root-layer";

inline constexpr const char* kLayersDirective = "DocumentRootLayers";
inline constexpr const char* kEnableDirective = "EnableDocumentRootLayers";

inline constexpr const char* kLayersUsage = "DocumentRootLayers DirPath1 [DirPath2 ... [DirPathN]]";
inline constexpr const char* kEnableUsage = "EnableDocumentRootLayers On|Off";

/// The two directives of this module
[[nodiscard]] std::vector<strata_config::CommandSpec> layer_commands();

/// Translate-phase hook: defers a layer lookup to map-to-storage when the
/// request's scope has layering enabled. Always declines.
strata_host::HookResult translate_layers(strata_host::RequestRec& request,
                                         const strata_layer::FileProber& prober);

/// Map-to-storage work deferred by translate_layers. Sets filename and
/// metadata when a layer holds the file. Always declines.
strata_host::HookResult map_layers_to_storage(strata_host::RequestRec& request,
                                              const strata_layer::FileProber& prober);

/// Register the directives and the translate hook. Call once, before the
/// configuration is loaded.
[[nodiscard]] strata_core::Result<void> register_layer_module(strata_host::Server& server);

} // namespace strata_module
