#pragma once

#include "licenseheaders/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace licenseheaders {

struct LanguageEntry {
    CommentStyle style;
    std::vector<std::string> extensions;  // With leading dot, e.g. ".py"
};

// Keep-line rules shared by several languages
auto shebang_rule() -> KeepLineRule;
auto encoding_rule() -> KeepLineRule;
auto xml_declaration_rule() -> KeepLineRule;
auto php_open_tag_rule() -> KeepLineRule;

// Immutable table: language id -> comment rules, extension -> language id
class CommentStyleRegistry {
public:
    explicit CommentStyleRegistry(std::vector<LanguageEntry> entries);

    // Process-wide table of supported languages, built on first use
    static auto builtin() -> const CommentStyleRegistry&;

    // nullptr when the language is not registered
    auto lookup(std::string_view language) const -> const CommentStyle*;

    // Throws UnsupportedLanguageError instead of guessing a style
    auto require(std::string_view language) const -> const CommentStyle&;

    auto language_for_path(const std::filesystem::path& path) const -> std::optional<std::string>;

    auto languages() const -> std::vector<std::string>;
    auto extensions() const -> std::vector<std::string>;

private:
    std::vector<LanguageEntry> entries_;
};

} // namespace licenseheaders
