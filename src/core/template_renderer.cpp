#include "licenseheaders/core/template_renderer.hpp"
#include "licenseheaders/core/source_text.hpp"
#include "licenseheaders/errors.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace licenseheaders {

namespace {

struct Placeholder {
    std::string_view name;
    size_t end{};  // One past the closing brace
};

auto is_identifier_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Placeholder starting at pos ("${"), or nullopt when the text there is literal
auto parse_placeholder(std::string_view text, size_t pos) -> std::optional<Placeholder> {
    if (text.substr(pos, 2) != "${") {
        return std::nullopt;
    }

    size_t name_start = pos + 2;
    size_t name_end = name_start;
    while (name_end < text.size() && is_identifier_char(text[name_end])) {
        ++name_end;
    }

    if (name_end == name_start || name_end >= text.size() || text[name_end] != '}') {
        return std::nullopt;
    }
    return Placeholder{.name = text.substr(name_start, name_end - name_start), .end = name_end + 1};
}

} // namespace

auto placeholders(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> names;

    for (size_t pos = text.find('$'); pos != std::string_view::npos; pos = text.find('$', pos + 1)) {
        if (auto placeholder = parse_placeholder(text, pos)) {
            std::string name(placeholder->name);
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(std::move(name));
            }
        }
    }

    return names;
}

auto substitute(std::string_view text, const VariableSet& variables) -> std::string {
    std::string output;
    output.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        auto dollar = text.find('$', pos);
        if (dollar == std::string_view::npos) {
            output += text.substr(pos);
            break;
        }

        output += text.substr(pos, dollar - pos);

        auto placeholder = parse_placeholder(text, dollar);
        if (!placeholder) {
            output += '$';
            pos = dollar + 1;
            continue;
        }

        std::string name(placeholder->name);
        auto value = variables.find(name);
        if (!value) {
            throw MissingVariableError(name);
        }
        output += *value;
        pos = placeholder->end;
    }

    return output;
}

auto split_template_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;

    size_t pos = 0;
    while (pos < text.size()) {
        auto newline = text.find('\n', pos);
        auto line = text.substr(pos, newline == std::string_view::npos ? std::string_view::npos
                                                                        : newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);

        if (newline == std::string_view::npos) {
            break;
        }
        pos = newline + 1;
    }

    return lines;
}

auto wrap_comment(const std::vector<std::string>& body_lines, const CommentStyle& style)
    -> std::vector<std::string> {
    std::vector<std::string> wrapped;
    wrapped.reserve(body_lines.size() + 2);

    auto prefixed = [](std::string_view prefix, std::string_view body) {
        std::string line(prefix);
        line += trim_right(body);
        return std::string(trim_right(line));
    };

    if (const auto* block = std::get_if<BlockComment>(&style.syntax)) {
        wrapped.emplace_back(trim_right(block->start));
        for (const auto& body : body_lines) {
            wrapped.push_back(prefixed(block->line_prefix, body));
        }
        wrapped.emplace_back(trim_right(block->end));
    } else {
        const auto& comment = std::get<LineComment>(style.syntax);
        for (const auto& body : body_lines) {
            wrapped.push_back(prefixed(comment.prefix, body));
        }
    }

    return wrapped;
}

auto render(const Template& tmpl, const VariableSet& variables, const CommentStyle& style)
    -> std::vector<std::string> {
    auto substituted = substitute(tmpl.text, variables);
    return wrap_comment(split_template_lines(substituted), style);
}

} // namespace licenseheaders
