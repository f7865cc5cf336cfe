#include "common/config_loader.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {
std::filesystem::path TempPath(const std::string& suffix) {
    auto base = std::filesystem::temp_directory_path();
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("labgate_test_" + suffix + "_" + std::to_string(now));
}
} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("LABGATE_JWT_SECRET");
        ::unsetenv("LABGATE_CLEANUP_API_KEY");
    }

    void TearDown() override {
        ::unsetenv("LABGATE_JWT_SECRET");
        ::unsetenv("LABGATE_CLEANUP_API_KEY");
        if (!temp_file_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_file_, ec);
        }
    }

    std::filesystem::path WriteTempConfig(const std::string& content) {
        temp_file_ = TempPath("config.json");
        std::ofstream ofs(temp_file_);
        ofs << content;
        ofs.flush();
        return temp_file_;
    }

private:
    std::filesystem::path temp_file_;
};

TEST_F(ConfigLoaderTest, LoadsLoggingConfig) {
    const std::string config_json = R"({
        "logging": {
            "level": "debug",
            "pattern": "[%H:%M:%S] %v",
            "console": false,
            "file": "temp/logs/server.log",
            "max_files": 5
        }
    })";
    auto config_path = WriteTempConfig(config_json);

    auto cfg = labgate::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "[%H:%M:%S] %v");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file, "temp/logs/server.log");
    EXPECT_EQ(cfg.logging.max_files, 5);
    // 未给出的字段保持默认值
    EXPECT_EQ(cfg.logging.max_file_size_mb, 10);
}

TEST_F(ConfigLoaderTest, LoadsAuthAndCleanupConfig) {
    const std::string config_json = R"({
        // 配置文件允许注释
        "auth": {
            "jwt_secret": "file-secret",
            "token_ttl_seconds": 3600,
            "secure_cookies": true,
            "request_limit": { "max_requests": 5, "window_seconds": 120 }
        },
        "cleanup": { "interval_seconds": 60, "revoked_grace_hours": 2, "api_key": "k1" },
        "delivery": { "sendmail_path": "/usr/sbin/sendmail" }
    })";
    auto config_path = WriteTempConfig(config_json);

    auto cfg = labgate::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.auth.jwt_secret, "file-secret");
    EXPECT_EQ(cfg.auth.token_ttl_seconds, 3600);
    EXPECT_EQ(cfg.auth.code_ttl_seconds, 600);
    EXPECT_TRUE(cfg.auth.secure_cookies);
    EXPECT_EQ(cfg.auth.request_limit.max_requests, 5);
    EXPECT_EQ(cfg.auth.request_limit.window_seconds, 120);
    EXPECT_EQ(cfg.cleanup.interval_seconds, 60);
    EXPECT_EQ(cfg.cleanup.code_retention_hours, 24);
    EXPECT_EQ(cfg.cleanup.revoked_grace_hours, 2);
    EXPECT_EQ(cfg.cleanup.api_key, "k1");
    EXPECT_EQ(cfg.delivery.sendmail_path, "/usr/sbin/sendmail");
    EXPECT_FALSE(cfg.storage.mysql.enabled);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesSecrets) {
    auto config_path = WriteTempConfig(R"({ "auth": { "jwt_secret": "file-secret" } })");
    ::setenv("LABGATE_JWT_SECRET", "env-secret", 1);
    ::setenv("LABGATE_CLEANUP_API_KEY", "env-key", 1);

    auto cfg = labgate::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.auth.jwt_secret, "env-secret");
    EXPECT_EQ(cfg.cleanup.api_key, "env-key");
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(labgate::common::ConfigLoader::Load("/nonexistent/labgate.json"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, ValidateRequiresSecret) {
    labgate::common::AppConfig cfg;
    EXPECT_THROW(labgate::common::ConfigLoader::Validate(cfg), std::runtime_error);

    cfg.auth.jwt_secret = "secret";
    EXPECT_NO_THROW(labgate::common::ConfigLoader::Validate(cfg));

    // 回看窗口不能短于验证码有效期
    cfg.auth.code_lookback_seconds = 60;
    EXPECT_THROW(labgate::common::ConfigLoader::Validate(cfg), std::runtime_error);
}

class LoggerInitTest : public ::testing::Test {
protected:
    void TearDown() override {
        labgate::common::ShutdownLogger();
        if (!temp_dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(temp_dir_, ec);
        }
    }

    std::filesystem::path PrepareLogPath(const std::string& filename) {
        temp_dir_ = TempPath("logs");
        return temp_dir_ / "logs" / filename;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(LoggerInitTest, CreatesDirectories) {
    auto log_file = PrepareLogPath("labgate.log");

    labgate::common::LoggingConfig config;
    config.console = false;
    config.level = "warn";
    config.pattern = "[test] %v";
    config.file = log_file.string();

    labgate::common::InitLogger(config);

    auto logger = labgate::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    EXPECT_TRUE(std::filesystem::exists(log_file.parent_path()));

    // 触发一次日志写入，确保文件被创建
    LABGATE_LOG_WARN("logger integration test");

    EXPECT_TRUE(std::filesystem::exists(log_file));
    EXPECT_EQ(logger, spdlog::default_logger());
}

TEST_F(LoggerInitTest, InvalidLevelFallsBackToInfo) {
    labgate::common::LoggingConfig config;
    config.console = false;
    config.level = "not-a-level";

    labgate::common::InitLogger(config);

    auto logger = labgate::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::info);
}
