#pragma once

#include "licenseheaders/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace licenseheaders {

// Year text the new header carries: explicit value, then the detected token
// (extended when refreshing), then the defaulted current year
auto effective_years(const VariableSet& variables, const std::optional<std::string>& detected,
                     const UpdateOptions& options) -> std::optional<std::string>;

// Insert the rendered header after the keep lines, or replace the detected license
// header. Other leading comments stay below the new header.
// Throws MissingVariableError; the input text is never partially modified.
auto update(std::string_view file_text, const CommentStyle& style, const Template& tmpl,
            const VariableSet& variables, const UpdateOptions& options) -> FileTransformResult;

// Rewrite only the year on the Copyright line of an existing license header
auto update_years(std::string_view file_text, const CommentStyle& style, std::string_view years)
    -> FileTransformResult;

} // namespace licenseheaders
