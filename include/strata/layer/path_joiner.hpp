#pragma once

/// @file path_joiner.hpp
/// @brief Candidate path construction for layer lookups

#include "fwd.hpp"

#include <string>
#include <string_view>

namespace strata_layer {

/// Syntactic canonicalization: repeated separators collapse, "." and ".."
/// segments fold lexically and a trailing separator is dropped. Symbolic
/// links are not resolved and the filesystem is not consulted.
[[nodiscard]] std::string canonicalize(std::string_view path);

/// Check if a layer directory is absolute
[[nodiscard]] bool is_absolute_layer(std::string_view layer_dir);

/// Build the candidate path for `request_path` inside a layer.
///
/// Absolute layers are used as-is; relative layers hang off `document_root`.
/// The request path is appended verbatim, so a leading '/' on it never
/// discards the base directory.
[[nodiscard]] std::string join_layer_path(std::string_view layer_dir,
                                          std::string_view document_root,
                                          std::string_view request_path);

} // namespace strata_layer
