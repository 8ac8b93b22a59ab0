#pragma once

/// @file config_parser.hpp
/// @brief httpd-style configuration text parser
///
/// Grammar, one logical line at a time:
/// - `# comment` lines and blank lines are ignored
/// - a trailing backslash joins the next physical line
/// - `Name arg1 "arg two" ...` is a directive
/// - `<Name args...>` opens a section, `</Name>` closes the innermost one
///
/// Inside double or single quotes, a backslash escapes the quote character;
/// any other backslash is kept, so regular expressions pass through intact.

#include "fwd.hpp"
#include "directive.hpp"
#include <strata/core/error.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata_config {

class ConfigParser {
public:
    ConfigParser() = default;

    /// Parse configuration text; `source` names it in error messages
    [[nodiscard]] strata_core::Result<DirectiveTree> parse_string(std::string_view text,
                                                                  const std::string& source) const;

    /// Read and parse a configuration file
    [[nodiscard]] strata_core::Result<DirectiveTree> parse_file(const std::filesystem::path& path) const;

    /// Split one logical line into words, honoring quotes
    [[nodiscard]] static std::vector<std::string> split_words(std::string_view line);
};

} // namespace strata_config
