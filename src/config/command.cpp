/// @file command.cpp
/// @brief Module command table implementation

#include <strata/config/command.hpp>
#include <strata/core/log.hpp>

namespace strata_config {

const char* args_how_name(ArgsHow how) noexcept {
    switch (how) {
        case ArgsHow::Take1: return "TAKE1";
        case ArgsHow::Iterate: return "ITERATE";
        default: return "UNKNOWN";
    }
}

strata_core::Result<void> CommandRegistry::add(CommandSpec spec) {
    if (!spec.handler) {
        return strata_core::Err(strata_core::Error(strata_core::ErrorCode::InvalidArgument,
            "Command has no handler: " + spec.name));
    }
    if (find(spec.name)) {
        return strata_core::Err(strata_core::ConfigError::duplicate_command(spec.name));
    }
    strata_core::config_logger()->debug("Registered command {} ({})", spec.name, args_how_name(spec.args_how));
    m_commands.push_back(std::move(spec));
    return strata_core::Ok();
}

const CommandSpec* CommandRegistry::find(std::string_view name) const noexcept {
    for (const auto& spec : m_commands) {
        if (names_equal(spec.name, name)) {
            return &spec;
        }
    }
    return nullptr;
}

strata_core::Result<void> CommandRegistry::invoke(const CommandSpec& spec,
                                                  const DirectiveOccurrence& occurrence,
                                                  ScopeConfig& scope) const {
    const auto& where = occurrence.location;

    switch (spec.args_how) {
        case ArgsHow::Take1: {
            if (occurrence.args.size() != 1) {
                auto err = strata_core::ConfigError::takes_one_argument(spec.name, spec.usage);
                err.at(where.file, where.line);
                return strata_core::Err(std::move(err));
            }
            return spec.handler(occurrence, scope, occurrence.args.front());
        }
        case ArgsHow::Iterate: {
            if (occurrence.args.empty()) {
                auto err = strata_core::ConfigError::requires_arguments(spec.name, spec.usage);
                err.at(where.file, where.line);
                return strata_core::Err(std::move(err));
            }
            for (const auto& arg : occurrence.args) {
                auto result = spec.handler(occurrence, scope, arg);
                if (!result) {
                    return result;
                }
            }
            return strata_core::Ok();
        }
    }

    return strata_core::Err(strata_core::Error(strata_core::ErrorCode::InvalidArgument,
        "Unsupported argument mode for " + spec.name));
}

} // namespace strata_config
