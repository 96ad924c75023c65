#include "licenseheaders/core/header_detector.hpp"
#include "licenseheaders/core/source_text.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace licenseheaders {

namespace {

auto years_pattern() -> const std::regex& {
    static const std::regex pattern{R"(\b(19|20)\d{2}(\s*-\s*(19|20)\d{2})?\b)"};
    return pattern;
}

auto year_range_pattern() -> const std::regex& {
    static const std::regex pattern{R"(^\s*((?:19|20)\d{2})(?:\s*-\s*((?:19|20)\d{2}))?\s*$)"};
    return pattern;
}

auto to_lower(std::string_view text) -> std::string {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// Offset just past "copyright" in line
auto after_copyright(std::string_view line) -> std::optional<size_t> {
    constexpr std::string_view marker = "copyright";
    auto pos = to_lower(line).find(marker);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos + marker.size();
}

auto find_block_header(std::span<const std::string> lines, size_t first, const BlockComment& block)
    -> std::optional<HeaderSpan> {
    auto open = trim(block.start);
    auto close = trim(block.end);
    if (open.empty() || close.empty()) {
        return std::nullopt;
    }

    auto head = trim_left(lines[first]);
    if (!head.starts_with(open)) {
        return std::nullopt;
    }

    // Single-line block: only text after the opener may close it
    if (head.substr(open.size()).find(close) != std::string_view::npos) {
        return HeaderSpan{.start_line = first, .end_line = first + 1};
    }

    for (size_t j = first + 1; j < lines.size(); ++j) {
        if (lines[j].find(close) != std::string::npos) {
            return HeaderSpan{.start_line = first, .end_line = j + 1};
        }
    }

    return std::nullopt; // Unterminated: never guess where the header ends
}

auto find_line_header(std::span<const std::string> lines, size_t first, const LineComment& comment)
    -> std::optional<HeaderSpan> {
    auto marker = trim(comment.prefix);
    if (marker.empty()) {
        return std::nullopt;
    }

    size_t end = first;
    while (end < lines.size() && !is_blank(lines[end])
           && trim_left(lines[end]).starts_with(marker)) {
        ++end;
    }

    if (end == first) {
        return std::nullopt;
    }
    return HeaderSpan{.start_line = first, .end_line = end};
}

} // namespace

auto find_header(std::span<const std::string> remainder_lines, const CommentStyle& style,
                 size_t max_leading_blank_lines) -> std::optional<HeaderSpan> {
    size_t first = 0;
    while (first < remainder_lines.size() && is_blank(remainder_lines[first])) {
        ++first;
    }

    if (first == remainder_lines.size() || first > max_leading_blank_lines) {
        return std::nullopt;
    }

    if (const auto* block = std::get_if<BlockComment>(&style.syntax)) {
        return find_block_header(remainder_lines, first, *block);
    }
    return find_line_header(remainder_lines, first, std::get<LineComment>(style.syntax));
}

auto span_text(std::span<const std::string> remainder_lines, const HeaderSpan& span)
    -> std::string {
    std::string text;
    auto end = std::min(span.end_line, remainder_lines.size());
    for (size_t i = span.start_line; i < end; ++i) {
        if (i > span.start_line) {
            text += '\n';
        }
        text += remainder_lines[i];
    }
    return text;
}

auto extract_years(std::string_view text) -> std::optional<std::string> {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(text.begin(), text.end(), match, years_pattern())) {
        return std::nullopt;
    }
    return match.str(0);
}

auto replace_years(std::string_view line, std::string_view years) -> std::optional<std::string> {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(line.begin(), line.end(), match, years_pattern())) {
        return std::nullopt;
    }

    auto offset = static_cast<size_t>(match.position(0));
    auto length = static_cast<size_t>(match.length(0));

    std::string replaced(line.substr(0, offset));
    replaced += years;
    replaced += line.substr(offset + length);
    return replaced;
}

auto copyright_years(std::string_view text) -> std::optional<std::string> {
    size_t pos = 0;
    while (pos < text.size()) {
        auto newline = text.find('\n', pos);
        auto line = text.substr(pos, newline == std::string_view::npos ? std::string_view::npos
                                                                        : newline - pos);
        if (auto start = after_copyright(line)) {
            if (auto years = extract_years(line.substr(*start))) {
                return years;
            }
        }

        if (newline == std::string_view::npos) {
            break;
        }
        pos = newline + 1;
    }
    return std::nullopt;
}

auto replace_copyright_years(std::string_view line, std::string_view years)
    -> std::optional<std::string> {
    auto start = after_copyright(line);
    if (!start) {
        return std::nullopt;
    }

    auto replaced = replace_years(line.substr(*start), years);
    if (!replaced) {
        return std::nullopt;
    }
    return std::string(line.substr(0, *start)) + *replaced;
}

auto is_license_text(std::string_view text) -> bool {
    auto lower = to_lower(text);
    if (lower.find("license") != std::string::npos || lower.find("licence") != std::string::npos) {
        return true;
    }
    return copyright_years(text).has_value();
}

auto parse_year_range(std::string_view token) -> std::optional<YearRange> {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(token.begin(), token.end(), match, year_range_pattern())) {
        return std::nullopt;
    }

    YearRange range;
    range.first = std::stoi(match.str(1));
    range.last = match[2].matched ? std::stoi(match.str(2)) : range.first;
    return range;
}

auto extend_year_range(const YearRange& range, int current_year) -> YearRange {
    return YearRange{.first = range.first, .last = std::max(range.last, current_year)};
}

auto format_year_range(const YearRange& range) -> std::string {
    if (range.first == range.last) {
        return std::to_string(range.first);
    }
    return std::to_string(range.first) + "-" + std::to_string(range.last);
}

} // namespace licenseheaders
