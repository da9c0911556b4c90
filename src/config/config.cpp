#include "dsync/config/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace dsync::config {

using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxPageSize = 1000;

/// Walks "a.b" through nested objects; nullptr when any part is missing
const json* find_field(const json& root, const std::string& dotted) {
    const json* current = &root;
    std::stringstream parts(dotted);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(part);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

template<typename T>
dsync::Result<void> read_optional(const json& root, const std::string& field, T& target) {
    const json* value = find_field(root, field);
    if (value == nullptr || value->is_null()) {
        return dsync::Ok();
    }
    try {
        target = value->get<T>();
    } catch (const json::exception& e) {
        return dsync::Err("Invalid value for configuration field " + field + ": " + e.what());
    }
    return dsync::Ok();
}

dsync::Result<std::string> read_required(const json& root, const std::string& field) {
    const json* value = find_field(root, field);
    if (value == nullptr) {
        return dsync::Err("Missing required configuration field: " + field);
    }
    if (!value->is_string() || value->get<std::string>().empty()) {
        return dsync::Err("Configuration field " + field + " must be a non-empty string");
    }
    return dsync::Ok(value->get<std::string>());
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

dsync::Result<AppConfig> parse_config(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return dsync::Err("Invalid JSON in configuration file");
    }

    AppConfig config;

    auto source = read_required(root, "source.folder_id");
    if (source.is_error()) {
        return dsync::Err(source.error());
    }
    config.source_folder_id = source.value();

    auto destination = read_required(root, "destination.folder_id");
    if (destination.is_error()) {
        return dsync::Err(destination.error());
    }
    config.destination_folder_id = destination.value();

    long long rate_limit = static_cast<long long>(config.performance.rate_limit);
    long long window_seconds = config.performance.time_window.count();
    long long page_size = static_cast<long long>(config.performance.page_size);
    long long batch_size = static_cast<long long>(config.migration.batch_size);
    long long max_retries = static_cast<long long>(config.migration.max_retries);

    for (const auto& status : {
             read_optional(root, "credentials.token_path", config.token_path),
             read_optional(root, "logging.log_directory", config.logging.log_directory),
             read_optional(root, "logging.log_level", config.logging.log_level),
             read_optional(root, "performance.user_rate_limit", rate_limit),
             read_optional(root, "performance.user_time_window", window_seconds),
             read_optional(root, "performance.page_size", page_size),
             read_optional(root, "migration.batch_size", batch_size),
             read_optional(root, "migration.max_retries", max_retries),
             read_optional(root, "migration.auto_fix_missing", config.migration.auto_fix_missing),
             read_optional(root, "migration.final_validation", config.migration.final_validation),
             read_optional(root, "migration.max_backoff_seconds", config.migration.max_backoff_seconds),
         }) {
        if (status.is_error()) {
            return dsync::Err(status.error());
        }
    }

    if (rate_limit <= 0) {
        return dsync::Err("performance.user_rate_limit must be positive");
    }
    if (window_seconds <= 0) {
        return dsync::Err("performance.user_time_window must be positive");
    }
    if (config.migration.max_backoff_seconds <= 0.0) {
        return dsync::Err("migration.max_backoff_seconds must be positive");
    }
    config.performance.rate_limit = static_cast<std::size_t>(rate_limit);
    config.performance.time_window = std::chrono::seconds(window_seconds);
    if (page_size < 0) {
        return dsync::Err("performance.page_size must not be negative");
    }
    if (batch_size < 0) {
        return dsync::Err("migration.batch_size must not be negative");
    }
    if (max_retries < 0) {
        return dsync::Err("migration.max_retries must not be negative");
    }
    config.performance.page_size = std::clamp<std::size_t>(static_cast<std::size_t>(page_size), 1, kMaxPageSize);
    config.migration.batch_size = std::max<std::size_t>(static_cast<std::size_t>(batch_size), 1);
    config.migration.max_retries = static_cast<std::size_t>(max_retries);
    return dsync::Ok(std::move(config));
}

dsync::Result<AppConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return dsync::Err("Configuration file not found at " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

dsync::Result<std::string> load_access_token(const AppConfig& config) {
    if (const char* env = std::getenv(kAccessTokenEnv)) {
        auto token = trim(env);
        if (!token.empty()) {
            return dsync::Ok(std::move(token));
        }
    }

    std::ifstream file(config.token_path);
    if (!file) {
        return dsync::Err("No access token: set " + std::string(kAccessTokenEnv) + " or create " + config.token_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto token = trim(buffer.str());
    if (token.empty()) {
        return dsync::Err("Token file " + config.token_path + " is empty");
    }
    return dsync::Ok(std::move(token));
}

} // namespace dsync::config
