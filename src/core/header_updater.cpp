#include "licenseheaders/core/header_updater.hpp"
#include "licenseheaders/core/header_detector.hpp"
#include "licenseheaders/core/keep_lines.hpp"
#include "licenseheaders/core/source_text.hpp"
#include "licenseheaders/core/template_renderer.hpp"
#include <algorithm>
#include <span>
#include <vector>

namespace licenseheaders {

auto effective_years(const VariableSet& variables, const std::optional<std::string>& detected,
                     const UpdateOptions& options) -> std::optional<std::string> {
    if (variables.is_explicit("years")) {
        return variables.find("years");
    }

    if (detected) {
        if (!options.refresh_years) {
            return detected;
        }
        if (auto range = parse_year_range(*detected)) {
            return format_year_range(extend_year_range(*range, options.current_year));
        }
        return detected;
    }

    return variables.find("years");
}

auto update(std::string_view file_text, const CommentStyle& style, const Template& tmpl,
            const VariableSet& variables, const UpdateOptions& options) -> FileTransformResult {
    auto source = split_source(file_text);
    auto texts = line_texts(source);

    auto keep = extract_keep_lines(texts, style);
    auto remainder = std::span<const std::string>(texts).subspan(keep.remainder_start);
    auto header = find_header(remainder, style);

    bool licensed = false;
    std::optional<std::string> detected_years;
    if (header) {
        auto text = span_text(remainder, *header);
        licensed = is_license_text(text);
        if (licensed) {
            detected_years = copyright_years(text);
        }
    }

    auto render_header = [&](const std::optional<std::string>& years_token) {
        VariableSet effective = variables;
        if (auto years = effective_years(variables, years_token, options)) {
            effective.set("years", *years);
        }
        return render(tmpl, effective, style);
    };

    std::optional<std::vector<std::string>> header_lines;
    if (header && !licensed) {
        // Ordinary leading comments stay; only an exact copy of this header counts as present
        header_lines = render_header(std::nullopt);
        auto existing = remainder.subspan(header->start_line, header->size());
        if (!std::equal(existing.begin(), existing.end(), header_lines->begin(), header_lines->end())) {
            header.reset();
        }
    }

    FileTransformResult result{.new_content = std::string(file_text),
                               .changed = false,
                               .header_found = header.has_value()};

    if (options.mode == UpdateMode::ADD_ONLY && header) {
        return result;
    }

    if (!header_lines) {
        header_lines = render_header(detected_years);
    }

    // Tolerated blank lines before an old header stay where they were
    size_t insert_at = keep.remainder_start + (header ? header->start_line : 0);
    size_t resume_at = keep.remainder_start + (header ? header->end_line : 0);

    SourceText output;
    output.line_ending = source.line_ending;
    output.lines.assign(source.lines.begin(), source.lines.begin() + insert_at);

    if (!header_lines->empty()) {
        if (!output.lines.empty() && output.lines.back().terminator.empty()) {
            output.lines.back().terminator = source.line_ending;
        }

        for (auto& line : *header_lines) {
            output.lines.push_back(SourceLine{.text = std::move(line), .terminator = source.line_ending});
        }

        bool replaced_through_eof = header && resume_at == source.lines.size();
        if (replaced_through_eof && source.lines.back().terminator.empty()) {
            output.lines.back().terminator.clear();
        }

        if (resume_at < source.lines.size() && !is_blank(source.lines[resume_at].text)) {
            output.lines.push_back(SourceLine{.text = "", .terminator = source.line_ending});
        }
    }

    output.lines.insert(output.lines.end(), source.lines.begin() + resume_at, source.lines.end());

    result.new_content = join_source(output);
    result.changed = result.new_content != file_text;
    return result;
}

auto update_years(std::string_view file_text, const CommentStyle& style, std::string_view years)
    -> FileTransformResult {
    auto source = split_source(file_text);
    auto texts = line_texts(source);

    auto keep = extract_keep_lines(texts, style);
    auto remainder = std::span<const std::string>(texts).subspan(keep.remainder_start);
    auto header = find_header(remainder, style);

    if (header && !is_license_text(span_text(remainder, *header))) {
        header.reset();
    }

    FileTransformResult result{.new_content = std::string(file_text),
                               .changed = false,
                               .header_found = header.has_value()};
    if (!header) {
        return result;
    }

    for (size_t i = header->start_line; i < header->end_line; ++i) {
        auto& line = source.lines[keep.remainder_start + i];
        if (auto replaced = replace_copyright_years(line.text, years)) {
            line.text = std::move(*replaced);
            result.new_content = join_source(source);
            result.changed = result.new_content != file_text;
            break;
        }
    }

    return result;
}

} // namespace licenseheaders
