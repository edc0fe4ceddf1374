#pragma once
/*
 * Logger
 *
 * Purpose: install the "mpage" spdlog logger as the default logger.
 * Note: never logs to stdout/stderr; without a path every record is dropped.
 */
#include <string>

// level: trace|debug|info|warn|error|off, empty means $MPAGE_LOG_LEVEL or info
bool init_logging(const std::string& path, const std::string& level, std::string& msg);
void shutdown_logging();
