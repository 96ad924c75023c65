#include "licenseheaders/application/batch_report.hpp"
#include <algorithm>
#include <iterator>

namespace licenseheaders {

auto BatchReport::count(FileStatus status) const -> size_t {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [status](const auto& o) { return o.status == status; }));
}

auto BatchReport::changed_count() const -> size_t {
    return count(FileStatus::ADDED) + count(FileStatus::REPLACED) + count(FileStatus::YEARS_UPDATED);
}

auto BatchReport::failures() const -> std::vector<FileOutcome> {
    std::vector<FileOutcome> failed;
    std::copy_if(outcomes.begin(), outcomes.end(), std::back_inserter(failed),
                 [](const auto& o) { return o.status == FileStatus::FAILED; });
    return failed;
}

auto BatchReport::has_failures() const -> bool {
    return count(FileStatus::FAILED) > 0;
}

auto status_display_name(FileStatus status) -> std::string {
    switch (status) {
    case FileStatus::ADDED:
        return "Header added";
    case FileStatus::REPLACED:
        return "Header replaced";
    case FileStatus::YEARS_UPDATED:
        return "Years updated";
    case FileStatus::UNCHANGED:
        return "Unchanged";
    case FileStatus::FAILED:
        return "Failed";
    }
    return "Unknown";
}

} // namespace licenseheaders
