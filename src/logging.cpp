#include "licenseheaders/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace licenseheaders {

auto log_level_for_verbosity(int verbosity) -> spdlog::level::level_enum {
    if (verbosity <= 0) {
        return spdlog::level::warn;
    }
    if (verbosity == 1) {
        return spdlog::level::info;
    }
    return spdlog::level::debug;
}

auto configure_logging(int verbosity) -> void {
    auto logger = spdlog::get("licenseheaders");
    if (!logger) {
        logger = spdlog::stderr_color_mt("licenseheaders");
    }
    logger->set_pattern("%^[%l]%$ %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(log_level_for_verbosity(verbosity));
}

} // namespace licenseheaders
