//! # Board Manifest Parser
//!
//! Parses `kmake.toml` into a `TomlTable`, then binds the table onto a
//! `Manifest`, rejecting unknown sections, unknown keys and mistyped values.

#include "config/manifest.hpp"

#include "log/log.hpp"

#include <fstream>
#include <functional>
#include <sstream>

namespace kmake::config {

// ============================================================================
// ManifestParser
// ============================================================================

ManifestParser::ManifestParser(std::string content) : content_(std::move(content)) {}

char ManifestParser::advance() {
    char c = content_[pos_++];
    if (c == '\n')
        ++line_;
    return c;
}

void ManifestParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void ManifestParser::skip_comment() {
    if (peek() != '#')
        return;
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

bool ManifestParser::at_line_end() {
    skip_inline_whitespace();
    skip_comment();
    if (is_eof())
        return true;
    if (peek() == '\n') {
        advance();
        return true;
    }
    return false;
}

void ManifestParser::skip_blank_lines() {
    while (!is_eof()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '#') {
            skip_comment();
        } else {
            break;
        }
    }
}

BuildError ManifestParser::error(const std::string& what) const {
    return BuildError::configuration("line " + std::to_string(line_) + ": " + what);
}

static bool is_key_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.';
}

BuildResult<std::string> ManifestParser::parse_key() {
    std::string key;
    while (!is_eof() && is_key_char(peek())) {
        key += advance();
    }
    if (key.empty()) {
        return error(std::string("expected a key, found '") + peek() + "'");
    }
    return key;
}

BuildResult<std::string> ManifestParser::parse_string() {
    char quote = advance();
    std::string value;

    while (true) {
        if (is_eof() || peek() == '\n') {
            return error("unterminated string");
        }
        char c = advance();
        if (c == quote) {
            break;
        }
        // Single-quoted strings are literal.
        if (c == '\\' && quote == '"') {
            if (is_eof()) {
                return error("unterminated string");
            }
            char esc = advance();
            switch (esc) {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            case '"':
                value += '"';
                break;
            case '\\':
                value += '\\';
                break;
            default:
                return error(std::string("unknown escape '\\") + esc + "'");
            }
            continue;
        }
        value += c;
    }
    return value;
}

BuildResult<std::vector<std::string>> ManifestParser::parse_array() {
    advance(); // '['
    std::vector<std::string> items;

    while (true) {
        skip_blank_lines();
        if (is_eof()) {
            return error("unterminated array");
        }
        if (peek() == ']') {
            advance();
            return items;
        }
        if (peek() != '"' && peek() != '\'') {
            return error("arrays may only contain strings");
        }
        auto item = parse_string();
        if (is_err(item)) {
            return unwrap_err(item);
        }
        items.push_back(std::move(unwrap(item)));

        skip_blank_lines();
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            return error("expected ',' or ']' in array");
        }
    }
}

BuildResult<TomlValue> ManifestParser::parse_value() {
    char c = peek();

    if (c == '"' || c == '\'') {
        auto s = parse_string();
        if (is_err(s))
            return unwrap_err(s);
        return TomlValue{std::move(unwrap(s))};
    }

    if (c == '[') {
        auto arr = parse_array();
        if (is_err(arr))
            return unwrap_err(arr);
        return TomlValue{std::move(unwrap(arr))};
    }

    if (content_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        return TomlValue{true};
    }
    if (content_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        return TomlValue{false};
    }

    if (c == '-' || c == '+' || (c >= '0' && c <= '9')) {
        std::string digits;
        if (c == '-' || c == '+') {
            digits += advance();
        }
        while (!is_eof() && ((peek() >= '0' && peek() <= '9') || peek() == '_')) {
            char d = advance();
            if (d != '_')
                digits += d;
        }
        if (digits.empty() || digits == "-" || digits == "+") {
            return error("malformed integer");
        }
        try {
            return TomlValue{static_cast<int64_t>(std::stoll(digits))};
        } catch (const std::out_of_range&) {
            return error("integer out of range: " + digits);
        }
    }

    return error(std::string("unexpected character '") + c + "' in value");
}

BuildResult<TomlTable> ManifestParser::parse() {
    TomlTable table;
    std::string section;

    while (true) {
        skip_blank_lines();
        if (is_eof())
            break;

        if (peek() == '[') {
            advance();
            skip_inline_whitespace();
            auto name = parse_key();
            if (is_err(name))
                return unwrap_err(name);
            skip_inline_whitespace();
            if (peek() != ']') {
                return error("expected ']' after section name");
            }
            advance();
            section = unwrap(name);
            if (table.count(section) != 0) {
                return error("duplicate section [" + section + "]");
            }
            table[section];
            if (!at_line_end()) {
                return error("unexpected text after section header");
            }
            continue;
        }

        int key_line = line_;
        auto key = parse_key();
        if (is_err(key))
            return unwrap_err(key);
        skip_inline_whitespace();
        if (peek() != '=') {
            return error("expected '=' after key \"" + unwrap(key) + "\"");
        }
        advance();
        skip_inline_whitespace();

        auto value = parse_value();
        if (is_err(value))
            return unwrap_err(value);
        if (!at_line_end()) {
            return error("unexpected text after value");
        }

        auto& entries = table[section];
        if (entries.count(unwrap(key)) != 0) {
            return BuildError::configuration("line " + std::to_string(key_line) +
                                             ": duplicate key \"" + unwrap(key) + "\"");
        }
        entries.emplace(unwrap(key), std::move(unwrap(value)));
    }

    return table;
}

// ============================================================================
// Binding
// ============================================================================

namespace {

const char* value_type_name(const TomlValue& value) {
    switch (value.index()) {
    case 0:
        return "string";
    case 1:
        return "integer";
    case 2:
        return "boolean";
    case 3:
        return "array";
    }
    return "value";
}

template <typename T> const char* expected_type_name();
template <> const char* expected_type_name<std::string>() {
    return "string";
}
template <> const char* expected_type_name<int64_t>() {
    return "integer";
}
template <> const char* expected_type_name<bool>() {
    return "boolean";
}
template <> const char* expected_type_name<std::vector<std::string>>() {
    return "array";
}

/// Stores a value into a field, or returns the expected type name on mismatch.
using Binder = std::function<const char*(const TomlValue&)>;

template <typename T> Binder bind(T& slot) {
    return [&slot](const TomlValue& value) -> const char* {
        if (const auto* typed = std::get_if<T>(&value)) {
            slot = *typed;
            return nullptr;
        }
        return expected_type_name<T>();
    };
}

using SectionBinders = std::map<std::string, Binder>;

std::map<std::string, SectionBinders> make_binders(Manifest& m) {
    return {
        {"board",
         {
             {"platform", bind(m.board.platform)},
             {"target", bind(m.board.target)},
         }},
        {"toolchain",
         {
             {"family", bind(m.toolchain.family)},
             {"rustc", bind(m.toolchain.rustc)},
             {"cargo", bind(m.toolchain.cargo)},
             {"rustup", bind(m.toolchain.rustup)},
             {"size", bind(m.toolchain.size)},
             {"objcopy", bind(m.toolchain.objcopy)},
             {"objdump", bind(m.toolchain.objdump)},
         }},
        {"build",
         {
             {"root", bind(m.build.root)},
             {"linker_script", bind(m.build.linker_script)},
             {"linker", bind(m.build.linker)},
             {"linker_flavor", bind(m.build.linker_flavor)},
             {"relocation_model", bind(m.build.relocation_model)},
             {"max_page_size", bind(m.build.max_page_size)},
             {"version_env", bind(m.build.version_env)},
             {"extra_rustflags", bind(m.build.extra_rustflags)},
         }},
        {"rustup",
         {
             {"minimum_version", bind(m.rustup.minimum_version)},
             {"update_delay_ms", bind(m.rustup.update_delay_ms)},
             {"components", bind(m.rustup.components)},
         }},
        {"digest",
         {
             {"source_dir", bind(m.digest.source_dir)},
             {"tool", bind(m.digest.tool)},
         }},
    };
}

} // namespace

BuildResult<Manifest> Manifest::parse(const std::string& content, const std::string& origin) {
    ManifestParser parser(content);
    auto parsed = parser.parse();
    if (is_err(parsed)) {
        auto err = unwrap_err(parsed);
        err.message = origin + ": " + err.message;
        return err;
    }

    Manifest manifest;
    auto binders = make_binders(manifest);

    for (const auto& [section, entries] : unwrap(parsed)) {
        auto sec = binders.find(section);
        if (sec == binders.end()) {
            if (section.empty() && !entries.empty()) {
                return BuildError::configuration(origin + ": key \"" + entries.begin()->first +
                                                 "\" appears before any [section]");
            }
            if (section.empty())
                continue;
            return BuildError::configuration(origin + ": unknown section [" + section + "]");
        }

        for (const auto& [key, value] : entries) {
            auto binder = sec->second.find(key);
            if (binder == sec->second.end()) {
                return BuildError::configuration(origin + ": unknown key \"" + key + "\" in [" +
                                                 section + "]");
            }
            if (const char* expected = binder->second(value)) {
                return BuildError::configuration(origin + ": [" + section + "] " + key +
                                                 " expects " + expected + ", found " +
                                                 value_type_name(value));
            }
        }
    }

    if (manifest.build.max_page_size <= 0) {
        return BuildError::configuration(origin + ": [build] max_page_size must be positive");
    }
    if (manifest.rustup.update_delay_ms < 0) {
        return BuildError::configuration(origin +
                                         ": [rustup] update_delay_ms must not be negative");
    }

    return manifest;
}

BuildResult<Manifest> Manifest::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return BuildError::configuration("cannot open manifest " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    KMAKE_LOG_DEBUG("config", "Loaded manifest " << path.string());
    return parse(buffer.str(), path.string());
}

} // namespace kmake::config
