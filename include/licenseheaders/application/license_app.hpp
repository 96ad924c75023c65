#pragma once

#include "licenseheaders/application/batch_report.hpp"
#include "licenseheaders/config/variables.hpp"
#include "licenseheaders/core/comment_style.hpp"
#include "licenseheaders/interfaces.hpp"
#include "licenseheaders/io/file_selection.hpp"
#include "licenseheaders/templates/template_catalog.hpp"
#include "licenseheaders/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace licenseheaders {

struct Config {
    std::string directory = ".";
    std::optional<std::string> template_query;    // Built-in name or template file
    std::map<std::string, std::string> variables;  // Explicit values from the command line
    std::vector<std::string> excludes;
    UpdateMode mode = UpdateMode::REPLACE;
    bool refresh_years = false;
    bool include_file_name = true;  // ${file_name} is "This file" when false
    bool backup = false;            // Copy to <path>.bak before writing
    bool dry_run = false;
    int verbosity = 0;
};

class LicenseApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    const CommentStyleRegistry& registry_;
    const TemplateCatalog& catalog_;
    EnvironmentLookup environment_;
    int current_year_;

public:
    LicenseApp(std::unique_ptr<IFileSystem> filesystem, const CommentStyleRegistry& registry,
               const TemplateCatalog& catalog, EnvironmentLookup environment, int current_year);

    // 0 when every file succeeded, 1 when some failed, 2 on configuration errors
    auto run(const Config& config) -> int;

    // Throws LicenseHeaderError for errors that stop the whole run
    auto process(const Config& config) -> BatchReport;

private:
    auto process_file(const SelectedFile& file, const Config& config,
                      const std::optional<Template>& tmpl, const VariableSet& variables)
        -> FileOutcome;

    // Error message, or nullopt once the new content is on disk
    auto write_result(const std::string& path, const std::string& content, const Config& config)
        -> std::optional<std::string>;
};

} // namespace licenseheaders
