#pragma once

/// @file directive.hpp
/// @brief Configuration directive tree
///
/// A parsed configuration file is a tree of DirectiveOccurrence nodes. Each
/// node owns its children; the parent link is a non-owning, read-only
/// pointer back into the same tree, valid for as long as the tree lives.
/// Section nodes are named with their leading '<' ("<VirtualHost"), plain
/// directives by their bare name ("DocumentRoot").

#include "fwd.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strata_config {

/// Where an occurrence was read from
struct SourceLocation {
    std::string file;
    std::size_t line = 0;
};

// =============================================================================
// DirectiveOccurrence
// =============================================================================

/// A single use of a directive or section in the configuration tree
struct DirectiveOccurrence {
    std::string name;
    std::vector<std::string> args;
    const DirectiveOccurrence* parent = nullptr;
    std::vector<std::unique_ptr<DirectiveOccurrence>> children;
    SourceLocation location;

    /// Check if this occurrence opens a section
    [[nodiscard]] bool is_section() const noexcept {
        return !name.empty() && name.front() == '<';
    }

    /// Section name without the leading '<', or the plain directive name
    [[nodiscard]] std::string_view bare_name() const noexcept {
        std::string_view view(name);
        if (is_section()) {
            view.remove_prefix(1);
        }
        return view;
    }

    /// Case-insensitive name comparison, the way the host matches directives
    [[nodiscard]] bool is(std::string_view directive_name) const noexcept;

    /// Append a child and link it back to this node
    DirectiveOccurrence& add_child(std::unique_ptr<DirectiveOccurrence> child);
};

// =============================================================================
// DirectiveTree
// =============================================================================

/// Owning root of a parsed configuration
struct DirectiveTree {
    std::string source;
    std::vector<std::unique_ptr<DirectiveOccurrence>> top_level;

    /// Total number of occurrences, sections included
    [[nodiscard]] std::size_t size() const noexcept;
};

/// ASCII case-insensitive equality
[[nodiscard]] bool names_equal(std::string_view a, std::string_view b) noexcept;

} // namespace strata_config
