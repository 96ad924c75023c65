#pragma once

#include "licenseheaders/core/comment_style.hpp"
#include <string>
#include <vector>

namespace licenseheaders {

struct SelectedFile {
    std::string path;
    std::string language;

    auto operator==(const SelectedFile& other) const -> bool = default;
};

// Registered extensions only; a path containing any exclude substring is dropped
auto select_files(const std::vector<std::string>& paths, const CommentStyleRegistry& registry,
                  const std::vector<std::string>& excludes) -> std::vector<SelectedFile>;

} // namespace licenseheaders
