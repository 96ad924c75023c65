#include "licenseheaders/core/comment_style.hpp"
#include "licenseheaders/core/source_text.hpp"
#include "licenseheaders/errors.hpp"
#include <algorithm>

namespace licenseheaders {

namespace {

auto c_block() -> BlockComment {
    return BlockComment{.start = "/*", .end = " */", .line_prefix = " * "};
}

auto line(std::string prefix) -> LineComment {
    return LineComment{.prefix = std::move(prefix)};
}

auto entry(std::string language, std::variant<BlockComment, LineComment> syntax,
           std::vector<std::string> extensions, std::vector<KeepLineRule> keep_lines = {})
    -> LanguageEntry {
    return LanguageEntry{.style = CommentStyle{.language = std::move(language),
                                               .syntax = std::move(syntax),
                                               .keep_lines = std::move(keep_lines)},
                         .extensions = std::move(extensions)};
}

auto builtin_entries() -> std::vector<LanguageEntry> {
    std::vector<LanguageEntry> entries;

    // Block comment languages
    entries.push_back(entry("c", c_block(),
                            {".c", ".cc", ".cpp", ".cxx", ".c++", ".h", ".hh", ".hpp", ".hxx"}));
    entries.push_back(entry("java", c_block(), {".java", ".scala", ".groovy", ".jape", ".kt"}));
    entries.push_back(entry("javascript", c_block(), {".js", ".jsx", ".ts", ".tsx", ".mjs"},
                            {shebang_rule()}));
    entries.push_back(entry("css", c_block(), {".css", ".scss", ".less"}));
    entries.push_back(entry("php", c_block(), {".php"}, {php_open_tag_rule()}));
    entries.push_back(entry("xml", BlockComment{.start = "<!--", .end = "-->", .line_prefix = "  "},
                            {".xml", ".xsd", ".xsl", ".html", ".svg"},
                            {xml_declaration_rule()}));

    // Line comment languages
    entries.push_back(entry("go", line("// "), {".go"}));
    entries.push_back(entry("rust", line("// "), {".rs"}));
    entries.push_back(entry("csharp", line("// "), {".cs"}));
    entries.push_back(entry("python", line("# "), {".py"}, {shebang_rule(), encoding_rule()}));
    entries.push_back(entry("shell", line("# "), {".sh", ".bash", ".zsh", ".csh"}, {shebang_rule()}));
    entries.push_back(entry("perl", line("# "), {".pl", ".pm"}, {shebang_rule()}));
    entries.push_back(entry("ruby", line("# "), {".rb"}, {shebang_rule(), encoding_rule()}));
    entries.push_back(entry("cmake", line("# "), {".cmake"}));
    entries.push_back(entry("sql", line("-- "), {".sql"}));
    entries.push_back(entry("lua", line("-- "), {".lua"}, {shebang_rule()}));
    entries.push_back(entry("haskell", line("-- "), {".hs"}));
    entries.push_back(entry("vb", line("' "), {".vb"}));
    entries.push_back(entry("erlang", line("%% "), {".erl", ".hrl"}));
    entries.push_back(entry("tex", line("% "), {".tex", ".sty"}));

    return entries;
}

} // namespace

auto shebang_rule() -> KeepLineRule {
    return KeepLineRule{.name = "shebang",
                        .matches = [](std::string_view line) { return line.starts_with("#!"); },
                        .max_line_index = 0};
}

auto encoding_rule() -> KeepLineRule {
    // PEP 263 / Ruby magic comment: '#', then "coding" followed by ':' or '='
    auto matches = [](std::string_view line) {
        auto start = line.find_first_not_of(" \t\f");
        if (start == std::string_view::npos || line[start] != '#') {
            return false;
        }
        constexpr std::string_view marker = "coding";
        for (auto pos = line.find(marker, start + 1); pos != std::string_view::npos;
             pos = line.find(marker, pos + 1)) {
            auto next = pos + marker.size();
            if (next < line.size() && (line[next] == ':' || line[next] == '=')) {
                return true;
            }
        }
        return false;
    };
    return KeepLineRule{.name = "encoding", .matches = matches, .max_line_index = 1};
}

auto xml_declaration_rule() -> KeepLineRule {
    auto matches = [](std::string_view line) {
        auto text = trim_left(line);
        return text.starts_with("<?xml") && text.find("?>", 5) != std::string_view::npos;
    };
    return KeepLineRule{.name = "xml-declaration", .matches = matches, .max_line_index = 0};
}

auto php_open_tag_rule() -> KeepLineRule {
    return KeepLineRule{.name = "php-open-tag",
                        .matches = [](std::string_view line) { return line.starts_with("<?php"); },
                        .max_line_index = 0};
}

CommentStyleRegistry::CommentStyleRegistry(std::vector<LanguageEntry> entries)
    : entries_(std::move(entries)) {}

auto CommentStyleRegistry::builtin() -> const CommentStyleRegistry& {
    static const CommentStyleRegistry registry{builtin_entries()};
    return registry;
}

auto CommentStyleRegistry::lookup(std::string_view language) const -> const CommentStyle* {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [language](const LanguageEntry& e) { return e.style.language == language; });
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->style;
}

auto CommentStyleRegistry::require(std::string_view language) const -> const CommentStyle& {
    if (const auto* style = lookup(language)) {
        return *style;
    }
    throw UnsupportedLanguageError(std::string(language));
}

auto CommentStyleRegistry::language_for_path(const std::filesystem::path& path) const
    -> std::optional<std::string> {
    auto extension = path.extension().string();
    if (extension.empty()) {
        return std::nullopt;
    }

    for (const auto& e : entries_) {
        if (std::find(e.extensions.begin(), e.extensions.end(), extension) != e.extensions.end()) {
            return e.style.language;
        }
    }
    return std::nullopt;
}

auto CommentStyleRegistry::languages() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) {
        result.push_back(e.style.language);
    }
    return result;
}

auto CommentStyleRegistry::extensions() const -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& e : entries_) {
        result.insert(result.end(), e.extensions.begin(), e.extensions.end());
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace licenseheaders
