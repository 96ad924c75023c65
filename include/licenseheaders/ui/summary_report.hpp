#pragma once

#include "licenseheaders/application/batch_report.hpp"

#include <ftxui/dom/elements.hpp>

#include <string>

namespace licenseheaders {

// Outcome counts plus one row per failed file
auto summary_element(const BatchReport& report) -> ftxui::Element;

// summary_element() laid out at its natural size, as plain terminal text
auto render_summary(const BatchReport& report) -> std::string;

} // namespace licenseheaders
