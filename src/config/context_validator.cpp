/// @file context_validator.cpp
/// @brief Directive context validation

#include <strata/config/context_validator.hpp>

#include <string>

namespace strata_config {

strata_core::Result<void> validate_context(const DirectiveOccurrence& occurrence) {
    for (const auto* ancestor = occurrence.parent; ancestor; ancestor = ancestor->parent) {
        for (auto forbidden : kForbiddenSections) {
            if (ancestor->is(forbidden)) {
                auto err = strata_core::ConfigError::context_not_allowed(
                    occurrence.name, std::string(forbidden));
                err.at(occurrence.location.file, occurrence.location.line);
                return strata_core::Err(std::move(err));
            }
        }
    }
    return strata_core::Ok();
}

} // namespace strata_config
