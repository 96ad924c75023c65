#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace licenseheaders {

// SourceText keeps every line's own terminator so untouched lines round-trip byte-exactly
struct SourceLine {
    std::string text;        // Without terminator
    std::string terminator;  // "\n", "\r\n" or "" for an unterminated last line
};

struct SourceText {
    std::vector<SourceLine> lines;
    std::string line_ending = "\n";  // Used for newly inserted lines
};

// Pure functions for SourceText manipulation
auto split_source(std::string_view content) -> SourceText;

auto join_source(const SourceText& source) -> std::string;

auto line_texts(const SourceText& source) -> std::vector<std::string>;

// Terminator of the first terminated line, "\n" when there is none
auto detect_line_ending(std::string_view content) -> std::string;

auto is_blank(std::string_view line) -> bool;
auto trim_left(std::string_view text) -> std::string_view;
auto trim_right(std::string_view text) -> std::string_view;
auto trim(std::string_view text) -> std::string_view;

} // namespace licenseheaders
