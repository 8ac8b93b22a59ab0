/// @file config_parser.cpp
/// @brief httpd-style configuration parser implementation

#include <strata/config/config_parser.hpp>
#include <strata/core/log.hpp>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace strata_config {

namespace {

struct LogicalLine {
    std::string text;
    std::size_t line = 0;  ///< Physical line the logical line starts on
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

/// Join continuation lines and number them
std::vector<LogicalLine> logical_lines(std::string_view text) {
    std::vector<LogicalLine> lines;
    LogicalLine current;
    bool continuing = false;
    std::size_t physical = 0;

    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view raw = text.substr(pos, end - pos);
        if (!raw.empty() && raw.back() == '\r') {
            raw.remove_suffix(1);
        }
        ++physical;

        if (!continuing) {
            current = LogicalLine{{}, physical};
        }

        std::string_view body = raw;
        while (!body.empty() && (body.back() == ' ' || body.back() == '\t')) {
            body.remove_suffix(1);
        }
        continuing = !body.empty() && body.back() == '\\';
        if (continuing) {
            body.remove_suffix(1);
            current.text.append(body);
            current.text.push_back(' ');
        } else {
            current.text.append(raw);
            lines.push_back(std::move(current));
        }

        if (end == text.size()) {
            break;
        }
        pos = end + 1;
    }

    if (continuing) {
        lines.push_back(std::move(current));
    }
    return lines;
}

} // anonymous namespace

std::vector<std::string> ConfigParser::split_words(std::string_view line) {
    std::vector<std::string> words;
    std::size_t i = 0;

    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) ++i;
        if (i >= line.size()) break;

        std::string word;
        char quote = line[i];
        if (quote == '"' || quote == '\'') {
            ++i;
            while (i < line.size() && line[i] != quote) {
                if (line[i] == '\\' && i + 1 < line.size() && line[i + 1] == quote) {
                    ++i;
                }
                word.push_back(line[i]);
                ++i;
            }
            if (i < line.size()) ++i;  // closing quote
        } else {
            while (i < line.size() && !is_space(line[i])) {
                word.push_back(line[i]);
                ++i;
            }
        }
        words.push_back(std::move(word));
    }

    return words;
}

strata_core::Result<DirectiveTree> ConfigParser::parse_string(std::string_view text,
                                                              const std::string& source) const {
    DirectiveTree tree;
    tree.source = source;
    std::vector<DirectiveOccurrence*> open;

    auto fail = [&source](const std::string& reason, std::size_t line) {
        auto err = strata_core::ConfigError::syntax(reason);
        err.at(source, line);
        return strata_core::Err<DirectiveTree>(std::move(err));
    };

    auto attach = [&tree, &open](std::unique_ptr<DirectiveOccurrence> node) -> DirectiveOccurrence& {
        if (open.empty()) {
            tree.top_level.push_back(std::move(node));
            return *tree.top_level.back();
        }
        return open.back()->add_child(std::move(node));
    };

    for (auto& logical : logical_lines(text)) {
        std::string_view line = trim(logical.text);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (line.size() >= 2 && line[0] == '<' && line[1] == '/') {
            if (line.back() != '>') {
                return fail("Closing section tag missing '>'", logical.line);
            }
            std::string closing(trim(line.substr(2, line.size() - 3)));
            if (open.empty()) {
                return fail("</" + closing + "> without matching <" + closing + "> section",
                            logical.line);
            }
            if (!names_equal(open.back()->bare_name(), closing)) {
                return fail("Expected </" + std::string(open.back()->bare_name()) +
                            "> but saw </" + closing + ">", logical.line);
            }
            open.pop_back();
            continue;
        }

        auto node = std::make_unique<DirectiveOccurrence>();
        node->location = SourceLocation{source, logical.line};

        if (line.front() == '<') {
            if (line.back() != '>') {
                return fail(std::string(line.substr(0, line.find_first_of(" \t"))) +
                            " directive missing closing '>'", logical.line);
            }
            auto words = split_words(line.substr(1, line.size() - 2));
            if (words.empty() || words.front().empty()) {
                return fail("Empty section tag", logical.line);
            }
            node->name = "<" + words.front();
            node->args.assign(words.begin() + 1, words.end());
            open.push_back(&attach(std::move(node)));
            continue;
        }

        auto words = split_words(line);
        node->name = words.front();
        node->args.assign(words.begin() + 1, words.end());
        attach(std::move(node));
    }

    if (!open.empty()) {
        const auto* unclosed = open.back();
        return fail(unclosed->name + "> was not closed.", unclosed->location.line);
    }

    strata_core::config_logger()->debug("Parsed {} directives from {}", tree.size(), source);
    return strata_core::Ok(std::move(tree));
}

strata_core::Result<DirectiveTree> ConfigParser::parse_file(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return strata_core::Err<DirectiveTree>(
            strata_core::ConfigError::io(path.string(), std::strerror(errno)));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_string(buffer.str(), path.string());
}

} // namespace strata_config
