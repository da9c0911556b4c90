#include "dsync/log/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <memory>
#include <vector>

namespace dsync::log {

dsync::Result<spdlog::level::level_enum> parse_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return dsync::Ok(spdlog::level::debug);
    if (upper == "INFO") return dsync::Ok(spdlog::level::info);
    if (upper == "WARNING" || upper == "WARN") return dsync::Ok(spdlog::level::warn);
    if (upper == "ERROR") return dsync::Ok(spdlog::level::err);
    if (upper == "CRITICAL") return dsync::Ok(spdlog::level::critical);
    return dsync::Err("Unknown log level: " + name);
}

std::string log_file_path(const std::string& directory) {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
    return (std::filesystem::path(directory) / ("sync_log_" + std::string(stamp) + ".log")).string();
}

dsync::Result<std::string> setup_logging(const config::LoggingConfig& config,
                                         const std::optional<std::string>& level_override) {
    auto level = parse_level(level_override.value_or(config.log_level));
    if (level.is_error()) {
        return dsync::Err(level.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(config.log_directory, ec);
    if (ec) {
        return dsync::Err("Cannot create log directory " + config.log_directory + ": " + ec.message());
    }

    const auto path = log_file_path(config.log_directory);

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
    try {
        file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    } catch (const spdlog::spdlog_ex& e) {
        return dsync::Err("Cannot open log file " + path + ": " + e.what());
    }
    file->set_pattern("%Y-%m-%d %H:%M:%S.%e - %l - %v");

    std::vector<spdlog::sink_ptr> sinks{console, file};
    auto logger = std::make_shared<spdlog::logger>("drivesync", sinks.begin(), sinks.end());
    logger->set_level(level.value());
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    return dsync::Ok(path);
}

} // namespace dsync::log
