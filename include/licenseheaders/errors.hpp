#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace licenseheaders {

class LicenseHeaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A ${name} placeholder had no value from any source
class MissingVariableError : public LicenseHeaderError {
public:
    explicit MissingVariableError(std::string variable)
        : LicenseHeaderError("missing value for template variable '" + variable + "'"),
          variable_(std::move(variable)) {}

    auto variable() const -> const std::string& { return variable_; }

private:
    std::string variable_;
};

class UnsupportedLanguageError : public LicenseHeaderError {
public:
    explicit UnsupportedLanguageError(std::string language)
        : LicenseHeaderError("no comment style registered for language '" + language + "'"),
          language_(std::move(language)) {}

    auto language() const -> const std::string& { return language_; }

private:
    std::string language_;
};

class TemplateResolutionError : public LicenseHeaderError {
public:
    using LicenseHeaderError::LicenseHeaderError;
};

} // namespace licenseheaders
