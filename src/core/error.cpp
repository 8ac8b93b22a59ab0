/// @file error.cpp
/// @brief Error handling implementation for strata_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiation for Result<void>
/// - Error formatting utilities

#include <strata/core/error.hpp>
#include <sstream>

namespace strata_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format configuration error with its source location
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    if (err.has_location()) {
        oss << "Syntax error on line " << err.line << " of " << err.file << ":\n";
    }
    oss << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;

} // namespace strata_core
