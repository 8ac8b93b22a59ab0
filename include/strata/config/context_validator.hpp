#pragma once

/// @file context_validator.hpp
/// @brief Load-time placement check for layer directives

#include "fwd.hpp"
#include "directive.hpp"
#include <strata/core/error.hpp>

#include <array>
#include <string_view>

namespace strata_config {

/// Sections that scope configuration to a filesystem path or file pattern.
/// Layering applies to the document root of a request scope, so layer
/// directives may not appear anywhere below one of these.
inline constexpr std::array<std::string_view, 4> kForbiddenSections = {
    "<Directory",
    "<DirectoryMatch",
    "<Files",
    "<FilesMatch",
};

/// Walk from `occurrence` up to the configuration root and fail with a
/// ConfigError::Kind::ContextNotAllowed naming the first forbidden ancestor.
[[nodiscard]] strata_core::Result<void> validate_context(const DirectiveOccurrence& occurrence);

} // namespace strata_config
