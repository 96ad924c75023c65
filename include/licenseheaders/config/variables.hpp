#pragma once

#include "licenseheaders/types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace licenseheaders {

inline constexpr std::string_view ENVIRONMENT_PREFIX = "LICENSEHEADERS_";

// Variables every run resolves, whether or not the template uses them
inline const std::vector<std::string> KNOWN_VARIABLES = {"owner", "years", "projectname",
                                                          "projecturl", "file_name"};

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

// "owner" -> "LICENSEHEADERS_OWNER"
auto environment_name(std::string_view variable) -> std::string;

// Reads the process environment
auto system_environment() -> EnvironmentLookup;

auto current_calendar_year() -> int;

// explicit value > environment override > built-in default (years only) > unset
auto resolve_variables(const std::map<std::string, std::string>& explicit_values,
                       const std::vector<std::string>& names, const EnvironmentLookup& environment,
                       int current_year) -> VariableSet;

} // namespace licenseheaders
