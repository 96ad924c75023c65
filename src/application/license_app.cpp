#include "licenseheaders/application/license_app.hpp"
#include "licenseheaders/core/header_updater.hpp"
#include "licenseheaders/core/template_renderer.hpp"
#include "licenseheaders/errors.hpp"
#include "licenseheaders/ui/summary_report.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>

namespace licenseheaders {

LicenseApp::LicenseApp(std::unique_ptr<IFileSystem> filesystem, const CommentStyleRegistry& registry,
                       const TemplateCatalog& catalog, EnvironmentLookup environment,
                       int current_year)
    : filesystem_(std::move(filesystem)), registry_(registry), catalog_(catalog),
      environment_(std::move(environment)), current_year_(current_year) {}

auto LicenseApp::run(const Config& config) -> int {
    BatchReport report;
    try {
        report = process(config);
    } catch (const LicenseHeaderError& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 2;
    }

    std::cout << render_summary(report) << '\n';

    if (report.has_failures()) {
        std::cerr << "Error: " << report.count(FileStatus::FAILED)
                  << " file(s) could not be processed\n";
        return 1;
    }
    return 0;
}

auto LicenseApp::process(const Config& config) -> BatchReport {
    std::optional<Template> tmpl;
    if (config.template_query) {
        tmpl = catalog_.resolve(*config.template_query, *filesystem_);
        spdlog::info("using template {}", tmpl->name);
    }

    auto names = KNOWN_VARIABLES;
    if (tmpl) {
        for (auto& name : placeholders(tmpl->text)) {
            names.push_back(std::move(name));
        }
    }
    auto variables = resolve_variables(config.variables, names, environment_, current_year_);

    if (!tmpl && !variables.is_explicit("years")) {
        throw LicenseHeaderError("no template specified and no years either, nothing to do");
    }

    auto files = select_files(filesystem_->list_files(config.directory), registry_, config.excludes);
    spdlog::info("processing {} file(s) under {}", files.size(), config.directory);

    BatchReport report;
    report.dry_run = config.dry_run;
    report.outcomes.reserve(files.size());

    for (const auto& file : files) {
        report.outcomes.push_back(process_file(file, config, tmpl, variables));
    }

    return report;
}

auto LicenseApp::process_file(const SelectedFile& file, const Config& config,
                              const std::optional<Template>& tmpl, const VariableSet& variables)
    -> FileOutcome {
    spdlog::debug("processing {} as {}", file.path, file.language);

    auto content = filesystem_->read_file(file.path);
    if (!content) {
        spdlog::error("cannot read {}", file.path);
        return FileOutcome{.path = file.path, .status = FileStatus::FAILED, .detail = "cannot read file"};
    }

    try {
        const auto& style = registry_.require(file.language);

        FileTransformResult result;
        FileStatus status = FileStatus::UNCHANGED;

        if (tmpl) {
            VariableSet file_variables = variables;
            file_variables.set("file_name", config.include_file_name
                                                ? std::filesystem::path(file.path).filename().string()
                                                : "This file");

            UpdateOptions options{.mode = config.mode,
                                  .refresh_years = config.refresh_years,
                                  .current_year = current_year_};
            result = update(*content, style, *tmpl, file_variables, options);
            status = result.header_found ? FileStatus::REPLACED : FileStatus::ADDED;
        } else {
            result = update_years(*content, style, *variables.find("years"));
            status = FileStatus::YEARS_UPDATED;
        }

        if (!result.changed) {
            spdlog::debug("unchanged: {}", file.path);
            return FileOutcome{.path = file.path, .status = FileStatus::UNCHANGED, .detail = ""};
        }

        if (!config.dry_run) {
            if (auto error = write_result(file.path, result.new_content, config)) {
                spdlog::error("{}: {}", file.path, *error);
                return FileOutcome{.path = file.path, .status = FileStatus::FAILED, .detail = *error};
            }
        }

        spdlog::info("{}: {}", status_display_name(status), file.path);
        return FileOutcome{.path = file.path, .status = status, .detail = ""};

    } catch (const LicenseHeaderError& e) {
        spdlog::error("{}: {}", file.path, e.what());
        return FileOutcome{.path = file.path, .status = FileStatus::FAILED, .detail = e.what()};
    }
}

auto LicenseApp::write_result(const std::string& path, const std::string& content,
                              const Config& config) -> std::optional<std::string> {
    if (config.backup && !filesystem_->copy_file(path, path + ".bak")) {
        return "cannot create backup " + path + ".bak";
    }

    if (!filesystem_->write_file(path, content)) {
        return std::string("cannot write file");
    }
    return std::nullopt;
}

} // namespace licenseheaders
