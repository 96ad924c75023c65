#include "licenseheaders/io/file_selection.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace licenseheaders {

auto select_files(const std::vector<std::string>& paths, const CommentStyleRegistry& registry,
                  const std::vector<std::string>& excludes) -> std::vector<SelectedFile> {
    std::vector<SelectedFile> selected;

    for (const auto& path : paths) {
        bool excluded = std::any_of(excludes.begin(), excludes.end(), [&path](const auto& pattern) {
            return !pattern.empty() && path.find(pattern) != std::string::npos;
        });
        if (excluded) {
            spdlog::debug("excluded: {}", path);
            continue;
        }

        auto language = registry.language_for_path(path);
        if (!language) {
            continue;
        }
        selected.push_back(SelectedFile{.path = path, .language = *language});
    }

    return selected;
}

} // namespace licenseheaders
