#include "licenseheaders/templates/template_catalog.hpp"
#include "licenseheaders/errors.hpp"
#include <algorithm>
#include <filesystem>

namespace licenseheaders {

namespace {

auto join_names(const std::vector<std::string>& names) -> std::string {
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += names[i];
    }
    return joined;
}

} // namespace

TemplateCatalog::TemplateCatalog(std::vector<Template> templates)
    : templates_(std::move(templates)) {}

auto TemplateCatalog::builtin() -> TemplateCatalog {
    return TemplateCatalog{builtin_templates()};
}

auto TemplateCatalog::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(templates_.size());
    for (const auto& tmpl : templates_) {
        result.push_back(tmpl.name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto TemplateCatalog::find(std::string_view query) const -> std::vector<const Template*> {
    std::vector<const Template*> matches;
    if (query.empty()) {
        return matches;
    }

    // "gpl-v3" must not be ambiguous with "lgpl-v3"
    for (const auto& tmpl : templates_) {
        if (tmpl.name == query) {
            return {&tmpl};
        }
    }

    for (const auto& tmpl : templates_) {
        if (tmpl.name.find(query) != std::string::npos) {
            matches.push_back(&tmpl);
        }
    }
    return matches;
}

auto TemplateCatalog::resolve(std::string_view query, IFileSystem& file_system) const -> Template {
    auto matches = find(query);

    if (matches.size() == 1) {
        return *matches.front();
    }

    if (matches.size() > 1) {
        std::vector<std::string> matched_names;
        for (const auto* tmpl : matches) {
            matched_names.push_back(tmpl->name);
        }
        throw TemplateResolutionError("there are multiple matching template names: "
                                      + join_names(matched_names));
    }

    std::string path(query);
    if (file_system.file_exists(path)) {
        if (auto content = file_system.read_file(path)) {
            return Template{.name = std::filesystem::path(path).filename().string(),
                            .text = std::move(*content)};
        }
        throw TemplateResolutionError("cannot read template file: " + path);
    }

    throw TemplateResolutionError("not a built-in template and not a file: " + path
                                  + " (built-in templates: " + join_names(names()) + ")");
}

} // namespace licenseheaders
