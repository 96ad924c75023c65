#include "licenseheaders/core/keep_lines.hpp"

namespace licenseheaders {

auto extract_keep_lines(std::span<const std::string> lines, const CommentStyle& style)
    -> KeepLineSplit {
    KeepLineSplit split;
    std::vector<bool> used(style.keep_lines.size(), false);

    for (size_t i = 0; i < lines.size(); ++i) {
        bool claimed = false;

        for (size_t r = 0; r < style.keep_lines.size(); ++r) {
            const auto& rule = style.keep_lines[r];
            if (used[r] || i > rule.max_line_index) {
                continue;
            }
            if (rule.matches && rule.matches(lines[i])) {
                used[r] = true;
                claimed = true;
                break;
            }
        }

        if (!claimed) {
            break;
        }
        split.keep_lines.push_back(lines[i]);
    }

    split.remainder_start = split.keep_lines.size();
    return split;
}

} // namespace licenseheaders
