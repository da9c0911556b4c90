#pragma once

#include "dsync/config/config.hpp"
#include "dsync/core/result.hpp"

#include <spdlog/common.h>

#include <optional>
#include <string>

namespace dsync::log {

/// DEBUG, INFO, WARNING (or WARN), ERROR, CRITICAL; case-insensitive
dsync::Result<spdlog::level::level_enum> parse_level(const std::string& name);

/// "<directory>/sync_log_YYYYmmdd_HHMMSS.log" for the current local time
std::string log_file_path(const std::string& directory);

/**
 * @brief Installs the default "drivesync" logger
 *
 * Console sink ("[12:00:00] [info] message") plus a per-run file sink
 * ("2024-01-01 12:00:00.000 - info - message"). Creates the log directory
 * when needed. Returns the path of the log file.
 */
dsync::Result<std::string> setup_logging(const config::LoggingConfig& config,
                                         const std::optional<std::string>& level_override = std::nullopt);

} // namespace dsync::log
