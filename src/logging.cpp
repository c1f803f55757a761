//
// Created by garrett on 2/25/25.
//

#include "logging.hpp"
#include "configuration.hpp"

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

std::string resolveLevel(const GeneralConfig& general) {
    if (const char* level = std::getenv("SNAPSYNC_LOG_LEVEL")) {
        return level;
    }
    if (!general.log_level.empty()) {
        return general.log_level;
    }
    return "info";
}

}

void initializeLogging(const GeneralConfig& general, bool debug) {
    auto logger = spdlog::get("snapsync");
    if (!logger) {
        logger = spdlog::stdout_color_mt("snapsync");
    }
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v");
    logger->set_level(debug ? spdlog::level::debug : spdlog::level::from_str(resolveLevel(general)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdownLogging() {
    spdlog::shutdown();
}
