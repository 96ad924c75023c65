#pragma once

#include <string>
#include <vector>

namespace licenseheaders {

enum class FileStatus {
    ADDED,          // Header inserted where none was detected
    REPLACED,       // Detected header rewritten
    YEARS_UPDATED,  // Only the year token changed
    UNCHANGED,
    FAILED
};

struct FileOutcome {
    std::string path;
    FileStatus status = FileStatus::UNCHANGED;
    std::string detail;  // Failure reason, empty otherwise
};

struct BatchReport {
    std::vector<FileOutcome> outcomes;
    bool dry_run = false;

    auto count(FileStatus status) const -> size_t;
    auto changed_count() const -> size_t;
    auto failures() const -> std::vector<FileOutcome>;
    auto has_failures() const -> bool;
};

auto status_display_name(FileStatus status) -> std::string;

} // namespace licenseheaders
