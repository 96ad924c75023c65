#include "licenseheaders/core/source_text.hpp"

namespace licenseheaders {

auto split_source(std::string_view content) -> SourceText {
    SourceText source;
    source.line_ending = detect_line_ending(content);

    size_t pos = 0;
    while (pos < content.size()) {
        auto newline = content.find('\n', pos);
        if (newline == std::string_view::npos) {
            source.lines.push_back(SourceLine{.text = std::string(content.substr(pos)),
                                              .terminator = ""});
            break;
        }

        size_t text_end = newline;
        if (text_end > pos && content[text_end - 1] == '\r') {
            --text_end;
        }
        source.lines.push_back(
            SourceLine{.text = std::string(content.substr(pos, text_end - pos)),
                       .terminator = std::string(content.substr(text_end, newline + 1 - text_end))});
        pos = newline + 1;
    }

    return source;
}

auto join_source(const SourceText& source) -> std::string {
    size_t total = 0;
    for (const auto& line : source.lines) {
        total += line.text.size() + line.terminator.size();
    }

    std::string output;
    output.reserve(total);
    for (const auto& line : source.lines) {
        output += line.text;
        output += line.terminator;
    }
    return output;
}

auto line_texts(const SourceText& source) -> std::vector<std::string> {
    std::vector<std::string> texts;
    texts.reserve(source.lines.size());
    for (const auto& line : source.lines) {
        texts.push_back(line.text);
    }
    return texts;
}

auto detect_line_ending(std::string_view content) -> std::string {
    auto newline = content.find('\n');
    if (newline == std::string_view::npos) {
        return "\n";
    }
    if (newline > 0 && content[newline - 1] == '\r') {
        return "\r\n";
    }
    return "\n";
}

auto is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t\r\f\v") == std::string_view::npos;
}

auto trim_left(std::string_view text) -> std::string_view {
    auto start = text.find_first_not_of(" \t\r\f\v");
    if (start == std::string_view::npos) {
        return {};
    }
    return text.substr(start);
}

auto trim_right(std::string_view text) -> std::string_view {
    auto end = text.find_last_not_of(" \t\r\f\v");
    if (end == std::string_view::npos) {
        return {};
    }
    return text.substr(0, end + 1);
}

auto trim(std::string_view text) -> std::string_view {
    return trim_right(trim_left(text));
}

} // namespace licenseheaders
