#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace licenseheaders {

// Header wrapped in open/close delimiters, e.g. /* ... */
struct BlockComment {
    std::string start;        // "/*"
    std::string end;          // " */"
    std::string line_prefix;  // " * " before each body line, may be empty
};

// Header where every line carries the same prefix, e.g. "# "
struct LineComment {
    std::string prefix;
};

// Leading line that must stay first and untouched (shebang, encoding marker)
struct KeepLineRule {
    std::string name;
    std::function<bool(std::string_view)> matches;  // Linear scan, no backtracking
    size_t max_line_index{};  // Positional: only lines 0..max_line_index qualify
};

struct CommentStyle {
    std::string language;
    std::variant<BlockComment, LineComment> syntax;
    std::vector<KeepLineRule> keep_lines;  // Priority order

    auto is_block() const -> bool { return std::holds_alternative<BlockComment>(syntax); }
};

struct Template {
    std::string name;
    std::string text;  // May contain ${name} placeholders
};

// Fully resolved substitution values handed to the core
struct VariableSet {
    std::map<std::string, std::string> values;
    std::set<std::string> defaulted;  // Keys filled from built-in defaults

    auto find(const std::string& name) const -> std::optional<std::string>;
    auto is_explicit(const std::string& name) const -> bool;
    auto set(const std::string& name, std::string value) -> void;
};

// Existing header inside the remainder lines, end exclusive
struct HeaderSpan {
    size_t start_line{};
    size_t end_line{};

    auto size() const -> size_t { return end_line - start_line; }
    auto operator==(const HeaderSpan& other) const -> bool = default;
};

enum class UpdateMode {
    REPLACE,   // Insert, or replace a detected header
    ADD_ONLY   // Insert only when no header is detected
};

struct UpdateOptions {
    UpdateMode mode = UpdateMode::REPLACE;
    bool refresh_years = false;  // Extend a detected range up to current_year
    int current_year{};
};

struct FileTransformResult {
    std::string new_content;
    bool changed = false;
    bool header_found = false;
};

} // namespace licenseheaders
