#pragma once

#include "licenseheaders/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace licenseheaders {

// Placeholder names (${name}) in order of first appearance, without duplicates
auto placeholders(std::string_view text) -> std::vector<std::string>;

// Single pass: substituted values are never re-scanned.
// Throws MissingVariableError for a placeholder without a value.
auto substitute(std::string_view text, const VariableSet& variables) -> std::string;

// Split substituted text into body lines; a final newline does not start a new line
auto split_template_lines(std::string_view text) -> std::vector<std::string>;

// Wrap body lines in the comment syntax, without trailing whitespace
auto wrap_comment(const std::vector<std::string>& body_lines, const CommentStyle& style)
    -> std::vector<std::string>;

auto render(const Template& tmpl, const VariableSet& variables, const CommentStyle& style)
    -> std::vector<std::string>;

} // namespace licenseheaders
