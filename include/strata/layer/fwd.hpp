#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_layer module

namespace strata_layer {

struct FileMetadata;
class FileProber;
class FilesystemProber;
struct LayerMatch;
class ResolutionOutcome;
class LayerResolver;

} // namespace strata_layer
