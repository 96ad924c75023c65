#include "licenseheaders/config/variables.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>

namespace licenseheaders {

auto VariableSet::find(const std::string& name) const -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto VariableSet::is_explicit(const std::string& name) const -> bool {
    return values.contains(name) && !defaulted.contains(name);
}

auto VariableSet::set(const std::string& name, std::string value) -> void {
    values[name] = std::move(value);
    defaulted.erase(name);
}

auto environment_name(std::string_view variable) -> std::string {
    std::string name(ENVIRONMENT_PREFIX);
    for (char c : variable) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

auto system_environment() -> EnvironmentLookup {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

auto current_calendar_year() -> int {
    auto today = std::chrono::year_month_day{
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
    return static_cast<int>(today.year());
}

auto resolve_variables(const std::map<std::string, std::string>& explicit_values,
                       const std::vector<std::string>& names, const EnvironmentLookup& environment,
                       int current_year) -> VariableSet {
    std::vector<std::string> all_names = names;
    for (const auto& [name, value] : explicit_values) {
        if (std::find(all_names.begin(), all_names.end(), name) == all_names.end()) {
            all_names.push_back(name);
        }
    }

    VariableSet variables;
    for (const auto& name : all_names) {
        if (auto it = explicit_values.find(name); it != explicit_values.end()) {
            variables.values[name] = it->second;
        } else if (auto value = environment ? environment(environment_name(name))
                                               : std::optional<std::string>{}) {
            variables.values[name] = *value;
        } else if (name == "years") {
            variables.values[name] = std::to_string(current_year);
            variables.defaulted.insert(name);
        }
    }

    return variables;
}

} // namespace licenseheaders
