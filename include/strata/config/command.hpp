#pragma once

/// @file command.hpp
/// @brief Module command table
///
/// Modules describe the directives they own as CommandSpecs. The host looks
/// them up while walking the directive tree and invokes the handler with the
/// ScopeConfig of the scope the directive appeared in.

#include "fwd.hpp"
#include "directive.hpp"
#include "scope_config.hpp"
#include <strata/core/error.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace strata_config {

/// How a command consumes its arguments
enum class ArgsHow : std::uint8_t {
    Take1,    ///< Exactly one argument, handler called once
    Iterate,  ///< One or more arguments, handler called once per argument
};

/// Get args mode name
[[nodiscard]] const char* args_how_name(ArgsHow how) noexcept;

using CommandHandler = std::function<strata_core::Result<void>(
    const DirectiveOccurrence& occurrence,
    ScopeConfig& scope,
    const std::string& arg)>;

/// A directive owned by a module
struct CommandSpec {
    std::string name;
    ArgsHow args_how = ArgsHow::Take1;
    std::string usage;  ///< Shown with argument errors
    CommandHandler handler;
};

// =============================================================================
// CommandRegistry
// =============================================================================

class CommandRegistry {
public:
    CommandRegistry() = default;

    /// Register a command; names are unique case-insensitively
    [[nodiscard]] strata_core::Result<void> add(CommandSpec spec);

    /// Find a command by directive name (case-insensitive)
    [[nodiscard]] const CommandSpec* find(std::string_view name) const noexcept;

    /// Check arguments against the command's ArgsHow and run its handler
    [[nodiscard]] strata_core::Result<void> invoke(const CommandSpec& spec,
                                                   const DirectiveOccurrence& occurrence,
                                                   ScopeConfig& scope) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_commands.size(); }
    [[nodiscard]] const std::vector<CommandSpec>& commands() const noexcept { return m_commands; }

private:
    std::vector<CommandSpec> m_commands;
};

} // namespace strata_config
