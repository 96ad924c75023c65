#include "licenseheaders/ui/summary_report.hpp"

#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

#include <vector>

namespace licenseheaders {

namespace {

auto header_row_table(std::vector<std::vector<std::string>> rows) -> ftxui::Element {
    using namespace ftxui;

    auto table = Table(std::move(rows));
    table.SelectAll().Border(LIGHT);
    table.SelectAll().SeparatorVertical(LIGHT);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).Border(LIGHT);
    return table.Render();
}

} // namespace

auto summary_element(const BatchReport& report) -> ftxui::Element {
    using namespace ftxui;

    std::vector<std::vector<std::string>> count_rows = {{"Outcome", "Files"}};
    for (auto status : {FileStatus::ADDED, FileStatus::REPLACED, FileStatus::YEARS_UPDATED,
                        FileStatus::UNCHANGED, FileStatus::FAILED}) {
        count_rows.push_back({status_display_name(status), std::to_string(report.count(status))});
    }

    std::string title = report.dry_run ? "=== License Header Summary (dry run, nothing written) ==="
                                       : "=== License Header Summary ===";

    Elements content = {
        text(title) | bold,
        text("Processed " + std::to_string(report.outcomes.size()) + " files, "
             + std::to_string(report.changed_count()) + " changed"),
        header_row_table(std::move(count_rows)),
    };

    auto failures = report.failures();
    if (!failures.empty()) {
        std::vector<std::vector<std::string>> failure_rows = {{"File", "Reason"}};
        for (const auto& failure : failures) {
            failure_rows.push_back({failure.path, failure.detail});
        }

        content.push_back(text(""));
        content.push_back(text("Failures") | bold | color(Color::Red));
        content.push_back(header_row_table(std::move(failure_rows)));
    }

    return vbox(std::move(content));
}

auto render_summary(const BatchReport& report) -> std::string {
    auto document = summary_element(report);
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);
    return screen.ToString();
}

} // namespace licenseheaders
