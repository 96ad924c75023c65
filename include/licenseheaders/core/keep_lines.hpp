#pragma once

#include "licenseheaders/types.hpp"
#include <span>
#include <string>
#include <vector>

namespace licenseheaders {

struct KeepLineSplit {
    std::vector<std::string> keep_lines;  // Strict prefix of the file, untouched
    size_t remainder_start{};             // Index of the first line after them
};

// Matching stops at the first leading line no unused rule claims at its position
auto extract_keep_lines(std::span<const std::string> lines, const CommentStyle& style)
    -> KeepLineSplit;

} // namespace licenseheaders
