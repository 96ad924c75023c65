#pragma once

#include <spdlog/spdlog.h>

namespace licenseheaders {

// 0 -> warn, 1 (-v) -> info, 2+ (-vv) -> debug
auto log_level_for_verbosity(int verbosity) -> spdlog::level::level_enum;

// Installs the stderr logger used by every module as the spdlog default
auto configure_logging(int verbosity) -> void;

} // namespace licenseheaders
