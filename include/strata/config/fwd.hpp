#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_config module

#include <cstdint>

namespace strata_config {

// =============================================================================
// Scope Configuration
// =============================================================================

struct ScopeConfig;
struct EffectiveConfig;

// =============================================================================
// Directive Tree
// =============================================================================

struct SourceLocation;
struct DirectiveOccurrence;
struct DirectiveTree;
class ConfigParser;

// =============================================================================
// Command Table
// =============================================================================

enum class ArgsHow : std::uint8_t;
struct CommandSpec;
class CommandRegistry;

} // namespace strata_config
