//
// Created by garrett on 2/25/25.
//

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

struct GeneralConfig;

// Install the "snapsync" stdout logger as spdlog's default logger.
// Level: SNAPSYNC_LOG_LEVEL, else general.log_level, else info. debug forces debug.
void initializeLogging(const GeneralConfig& general, bool debug);

void shutdownLogging();

#endif // LOGGING_HPP
