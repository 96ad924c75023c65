#pragma once

#include "licenseheaders/interfaces.hpp"
#include "licenseheaders/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace licenseheaders {

// License notices shipped with the tool
auto builtin_templates() -> std::vector<Template>;

// Immutable set of named templates, built once and passed by reference
class TemplateCatalog {
public:
    explicit TemplateCatalog(std::vector<Template> templates);

    static auto builtin() -> TemplateCatalog;

    auto names() const -> std::vector<std::string>;

    // Exact name first, otherwise every template whose name contains query
    auto find(std::string_view query) const -> std::vector<const Template*>;

    // Unique match, else query is read as a template file.
    // Throws TemplateResolutionError when ambiguous or unreadable.
    auto resolve(std::string_view query, IFileSystem& file_system) const -> Template;

private:
    std::vector<Template> templates_;
};

} // namespace licenseheaders
