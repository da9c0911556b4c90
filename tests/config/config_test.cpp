#include "dsync/config/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

using dsync::config::load_access_token;
using dsync::config::load_config;
using dsync::config::parse_config;

namespace {

const char* kMinimal = R"({
    "source": {"folder_id": "src-id"},
    "destination": {"folder_id": "dst-id"}
})";

class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("drivesync_config_" + std::to_string(::getpid()))) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        const auto file = path_ / name;
        std::ofstream(file) << content;
        return file.string();
    }

private:
    std::filesystem::path path_;
};

} // namespace

TEST(ConfigTest, MinimalDocumentUsesDefaults) {
    auto config = parse_config(kMinimal);
    ASSERT_TRUE(config.is_ok()) << config.error();

    const auto& c = config.value();
    EXPECT_EQ(c.source_folder_id, "src-id");
    EXPECT_EQ(c.destination_folder_id, "dst-id");
    EXPECT_EQ(c.token_path, "token.txt");
    EXPECT_EQ(c.logging.log_directory, "./logs");
    EXPECT_EQ(c.logging.log_level, "INFO");
    EXPECT_EQ(c.performance.rate_limit, 1000u);
    EXPECT_EQ(c.performance.time_window, std::chrono::seconds(60));
    EXPECT_EQ(c.performance.page_size, 1000u);
    EXPECT_EQ(c.migration.batch_size, 100u);
    EXPECT_EQ(c.migration.max_retries, 10u);
    EXPECT_TRUE(c.migration.auto_fix_missing);
    EXPECT_TRUE(c.migration.final_validation);
}

TEST(ConfigTest, ReadsEverySection) {
    auto config = parse_config(R"({
        "credentials": {"token_path": "/secrets/token"},
        "source": {"folder_id": "a"},
        "destination": {"folder_id": "b"},
        "logging": {"log_directory": "/var/log/ds", "log_level": "DEBUG"},
        "performance": {"user_rate_limit": 50, "user_time_window": 10, "page_size": 200},
        "migration": {"batch_size": 7, "max_retries": 2, "auto_fix_missing": false,
                      "final_validation": false, "max_backoff_seconds": 8}
    })");
    ASSERT_TRUE(config.is_ok()) << config.error();

    const auto& c = config.value();
    EXPECT_EQ(c.token_path, "/secrets/token");
    EXPECT_EQ(c.logging.log_level, "DEBUG");
    EXPECT_EQ(c.performance.rate_limit, 50u);
    EXPECT_EQ(c.performance.time_window, std::chrono::seconds(10));
    EXPECT_EQ(c.performance.page_size, 200u);
    EXPECT_EQ(c.migration.batch_size, 7u);
    EXPECT_EQ(c.migration.max_retries, 2u);
    EXPECT_FALSE(c.migration.auto_fix_missing);
    EXPECT_FALSE(c.migration.final_validation);
    EXPECT_DOUBLE_EQ(c.migration.max_backoff_seconds, 8.0);
}

TEST(ConfigTest, MissingRequiredFieldIsNamed) {
    auto config = parse_config(R"({"source": {"folder_id": "a"}})");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error(), "Missing required configuration field: destination.folder_id");
}

TEST(ConfigTest, RejectsMalformedJson) {
    auto config = parse_config("{ not json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error(), "Invalid JSON in configuration file");
}

TEST(ConfigTest, RejectsWrongFieldType) {
    auto config = parse_config(R"({
        "source": {"folder_id": "a"},
        "destination": {"folder_id": "b"},
        "migration": {"batch_size": "lots"}
    })");
    ASSERT_TRUE(config.is_error());
    EXPECT_NE(config.error().find("migration.batch_size"), std::string::npos);
}

TEST(ConfigTest, RejectsNonPositiveRateSettings) {
    EXPECT_TRUE(parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                 "performance": {"user_rate_limit": 0}})").is_error());
    EXPECT_TRUE(parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                 "performance": {"user_rate_limit": -5}})").is_error());
    EXPECT_TRUE(parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                 "performance": {"user_time_window": 0}})").is_error());
    EXPECT_TRUE(parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                 "migration": {"max_retries": -1}})").is_error());
    EXPECT_TRUE(parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                 "migration": {"batch_size": -3}})").is_error());
    EXPECT_TRUE(parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                 "performance": {"page_size": -10}})").is_error());

    auto no_retries = parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                      "migration": {"max_retries": 0}})");
    ASSERT_TRUE(no_retries.is_ok()) << no_retries.error();
    EXPECT_EQ(no_retries.value().migration.max_retries, 0u);
}

TEST(ConfigTest, ClampsPageAndBatchSizes) {
    auto config = parse_config(R"({"source": {"folder_id": "a"}, "destination": {"folder_id": "b"},
                                   "performance": {"page_size": 5000}, "migration": {"batch_size": 0}})");
    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().performance.page_size, 1000u);
    EXPECT_EQ(config.value().migration.batch_size, 1u);
}

TEST(ConfigTest, LoadReportsMissingFile) {
    auto config = load_config("/nonexistent/drivesync/config.json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error(), "Configuration file not found at /nonexistent/drivesync/config.json");
}

TEST(ConfigTest, LoadsFromDisk) {
    TempDir dir;
    auto config = load_config(dir.write("config.json", kMinimal));
    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().source_folder_id, "src-id");
}

TEST(AccessTokenTest, EnvironmentWinsOverFile) {
    TempDir dir;
    auto config = parse_config(kMinimal).value();
    config.token_path = dir.write("token.txt", "from-file\n");

    ::setenv(dsync::config::kAccessTokenEnv, "  from-env \n", 1);
    auto token = load_access_token(config);
    ::unsetenv(dsync::config::kAccessTokenEnv);

    ASSERT_TRUE(token.is_ok()) << token.error();
    EXPECT_EQ(token.value(), "from-env");
}

TEST(AccessTokenTest, FallsBackToTrimmedFile) {
    ::unsetenv(dsync::config::kAccessTokenEnv);
    TempDir dir;
    auto config = parse_config(kMinimal).value();
    config.token_path = dir.write("token.txt", "\n  ya29.token  \n");

    auto token = load_access_token(config);
    ASSERT_TRUE(token.is_ok()) << token.error();
    EXPECT_EQ(token.value(), "ya29.token");
}

TEST(AccessTokenTest, MissingTokenIsAnError) {
    ::unsetenv(dsync::config::kAccessTokenEnv);
    auto config = parse_config(kMinimal).value();
    config.token_path = "/nonexistent/drivesync/token.txt";

    auto token = load_access_token(config);
    ASSERT_TRUE(token.is_error());
    EXPECT_NE(token.error().find(dsync::config::kAccessTokenEnv), std::string::npos);
}
