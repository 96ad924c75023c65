#pragma once

#include "licenseheaders/types.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace licenseheaders {

// Blank lines allowed between the keep lines and the header
inline constexpr size_t DEFAULT_MAX_LEADING_BLANK_LINES = 2;

// Span is relative to remainder_lines. Unterminated block comments are absent.
auto find_header(std::span<const std::string> remainder_lines, const CommentStyle& style,
                 size_t max_leading_blank_lines = DEFAULT_MAX_LEADING_BLANK_LINES)
    -> std::optional<HeaderSpan>;

// Lines covered by span joined with "\n"
auto span_text(std::span<const std::string> remainder_lines, const HeaderSpan& span)
    -> std::string;

// First year or year range, e.g. "2019" or "2019 - 2021"
auto extract_years(std::string_view text) -> std::optional<std::string>;

// Line with its first year token replaced, nullopt when it has none
auto replace_years(std::string_view line, std::string_view years) -> std::optional<std::string>;

// Year token following "Copyright" (any case) on the first line that has one
auto copyright_years(std::string_view text) -> std::optional<std::string>;

// Line with the year token after "Copyright" replaced, nullopt when there is none
auto replace_copyright_years(std::string_view line, std::string_view years)
    -> std::optional<std::string>;

// A comment mentioning "license"/"licence" or a dated copyright. Other leading
// comments are documentation and never count as an existing header.
auto is_license_text(std::string_view text) -> bool;

struct YearRange {
    int first{};
    int last{};

    auto operator==(const YearRange& other) const -> bool = default;
};

auto parse_year_range(std::string_view token) -> std::optional<YearRange>;

// Start year kept, end year moved up to current_year, never shrinking
auto extend_year_range(const YearRange& range, int current_year) -> YearRange;

auto format_year_range(const YearRange& range) -> std::string;

} // namespace licenseheaders
