#pragma once

#include "dsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace dsync::config {

inline constexpr const char* kDefaultConfigPath = "./config.json";
inline constexpr const char* kAccessTokenEnv = "DRIVESYNC_ACCESS_TOKEN";

struct LoggingConfig {
    std::string log_directory = "./logs";
    std::string log_level = "INFO";
};

struct PerformanceConfig {
    std::size_t rate_limit = 1000;
    std::chrono::seconds time_window{60};
    std::size_t page_size = 1000; ///< Clamped to [1, 1000]
};

struct MigrationConfig {
    std::size_t batch_size = 100;
    std::size_t max_retries = 10;
    bool auto_fix_missing = true;
    bool final_validation = true;
    double max_backoff_seconds = 64.0;
};

struct AppConfig {
    std::string token_path = "token.txt";
    std::string source_folder_id;
    std::string destination_folder_id;
    LoggingConfig logging;
    PerformanceConfig performance;
    MigrationConfig migration;
};

/**
 * @brief Parses the JSON configuration document
 *
 * source.folder_id and destination.folder_id are required; every other
 * field falls back to its default. Errors name the offending field.
 */
dsync::Result<AppConfig> parse_config(const std::string& text);

/// Reads and parses the configuration file at `path`
dsync::Result<AppConfig> load_config(const std::string& path);

/**
 * @brief Access token for the remote service
 *
 * Taken from $DRIVESYNC_ACCESS_TOKEN when set, otherwise from the file named
 * by credentials.token_path (surrounding whitespace stripped).
 */
dsync::Result<std::string> load_access_token(const AppConfig& config);

} // namespace dsync::config
