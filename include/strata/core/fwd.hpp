#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_core module

#include <cstdint>

namespace strata_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace strata_core
