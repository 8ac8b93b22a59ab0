/// @file directive.cpp
/// @brief Directive tree helpers

#include <strata/config/directive.hpp>

#include <cctype>

namespace strata_config {

namespace {

std::size_t count_subtree(const DirectiveOccurrence& node) {
    std::size_t n = 1;
    for (const auto& child : node.children) {
        n += count_subtree(*child);
    }
    return n;
}

} // anonymous namespace

bool names_equal(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool DirectiveOccurrence::is(std::string_view directive_name) const noexcept {
    return names_equal(name, directive_name);
}

DirectiveOccurrence& DirectiveOccurrence::add_child(std::unique_ptr<DirectiveOccurrence> child) {
    child->parent = this;
    children.push_back(std::move(child));
    return *children.back();
}

std::size_t DirectiveTree::size() const noexcept {
    std::size_t n = 0;
    for (const auto& node : top_level) {
        n += count_subtree(*node);
    }
    return n;
}

} // namespace strata_config
