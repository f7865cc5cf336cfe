#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace labgate {
namespace common {

std::string DetectConfigPath() {
    if (const char* env = std::getenv("LABGATE_SERVER_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    auto config = FromJson(json);
    ApplyEnvOverrides(config);
    return config;
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

void ConfigLoader::Validate(const AppConfig& config) {
    if (config.auth.jwt_secret.empty()) {
        throw std::runtime_error(
            "auth.jwt_secret is not set; configure it or export LABGATE_JWT_SECRET");
    }
    if (config.auth.token_ttl_seconds <= 0 || config.auth.code_ttl_seconds <= 0) {
        throw std::runtime_error("auth token/code ttl must be positive");
    }
    if (config.auth.code_lookback_seconds < config.auth.code_ttl_seconds) {
        throw std::runtime_error("auth.code_lookback_seconds must not be shorter than auth.code_ttl_seconds");
    }
    if (config.cleanup.interval_seconds < 0) {
        throw std::runtime_error("cleanup.interval_seconds must not be negative");
    }
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 环境变量覆盖: 密钥不应写入仓库中的配置文件
void ConfigLoader::ApplyEnvOverrides(AppConfig& config) {
    if (const char* secret = std::getenv("LABGATE_JWT_SECRET")) {
        config.auth.jwt_secret = secret;
    }
    if (const char* api_key = std::getenv("LABGATE_CLEANUP_API_KEY")) {
        config.cleanup.api_key = api_key;
    }
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
        cfg.logging.max_file_size_mb = logging.value("max_file_size_mb", cfg.logging.max_file_size_mb);
        cfg.logging.max_files = logging.value("max_files", cfg.logging.max_files);
    }
    // Storage配置
    if (j.contains("storage")) {
        const auto& storage = j["storage"];
        if (storage.contains("mysql")) {
            const auto& mysql = storage["mysql"];
            cfg.storage.mysql.host = mysql.value("host", cfg.storage.mysql.host);
            cfg.storage.mysql.port = mysql.value("port", cfg.storage.mysql.port);
            cfg.storage.mysql.user = mysql.value("user", cfg.storage.mysql.user);
            cfg.storage.mysql.password = mysql.value("password", cfg.storage.mysql.password);
            cfg.storage.mysql.database = mysql.value("database", cfg.storage.mysql.database);
            cfg.storage.mysql.pool_size = mysql.value("pool_size", cfg.storage.mysql.pool_size);
            cfg.storage.mysql.connection_timeout_ms = mysql.value("connection_timeout_ms", cfg.storage.mysql.connection_timeout_ms);
            cfg.storage.mysql.read_timeout_ms = mysql.value("read_timeout_ms", cfg.storage.mysql.read_timeout_ms);
            cfg.storage.mysql.write_timeout_ms = mysql.value("write_timeout_ms", cfg.storage.mysql.write_timeout_ms);
            cfg.storage.mysql.enabled = mysql.value("enabled", cfg.storage.mysql.enabled);
        }
    }
    // Cache配置
    if (j.contains("cache")) {
        const auto& cache = j["cache"];
        if (cache.contains("redis")) {
            const auto& redis = cache["redis"];
            cfg.cache.redis.host = redis.value("host", cfg.cache.redis.host);
            cfg.cache.redis.port = redis.value("port", cfg.cache.redis.port);
            cfg.cache.redis.password = redis.value("password", cfg.cache.redis.password);
            cfg.cache.redis.db = redis.value("db", cfg.cache.redis.db);
            cfg.cache.redis.pool_size = redis.value("pool_size", cfg.cache.redis.pool_size);
            cfg.cache.redis.connection_timeout_ms = redis.value("connection_timeout_ms", cfg.cache.redis.connection_timeout_ms);
            cfg.cache.redis.socket_timeout_ms = redis.value("socket_timeout_ms", cfg.cache.redis.socket_timeout_ms);
            cfg.cache.redis.enabled = redis.value("enabled", cfg.cache.redis.enabled);
        }
    }
    // Auth配置
    if (j.contains("auth")) {
        const auto& auth = j["auth"];
        cfg.auth.jwt_secret = auth.value("jwt_secret", cfg.auth.jwt_secret);
        cfg.auth.token_ttl_seconds = auth.value("token_ttl_seconds", cfg.auth.token_ttl_seconds);
        cfg.auth.code_ttl_seconds = auth.value("code_ttl_seconds", cfg.auth.code_ttl_seconds);
        cfg.auth.code_lookback_seconds = auth.value("code_lookback_seconds", cfg.auth.code_lookback_seconds);
        cfg.auth.secure_cookies = auth.value("secure_cookies", cfg.auth.secure_cookies);
        if (auth.contains("request_limit")) {
            const auto& limit = auth["request_limit"];
            cfg.auth.request_limit.max_requests = limit.value("max_requests", cfg.auth.request_limit.max_requests);
            cfg.auth.request_limit.window_seconds = limit.value("window_seconds", cfg.auth.request_limit.window_seconds);
        }
    }
    // Cleanup配置
    if (j.contains("cleanup")) {
        const auto& cleanup = j["cleanup"];
        cfg.cleanup.interval_seconds = cleanup.value("interval_seconds", cfg.cleanup.interval_seconds);
        cfg.cleanup.code_retention_hours = cleanup.value("code_retention_hours", cfg.cleanup.code_retention_hours);
        cfg.cleanup.revoked_grace_hours = cleanup.value("revoked_grace_hours", cfg.cleanup.revoked_grace_hours);
        cfg.cleanup.api_key = cleanup.value("api_key", cfg.cleanup.api_key);
    }
    // Delivery配置
    if (j.contains("delivery")) {
        const auto& delivery = j["delivery"];
        cfg.delivery.sendmail_path = delivery.value("sendmail_path", cfg.delivery.sendmail_path);
        cfg.delivery.from_address = delivery.value("from_address", cfg.delivery.from_address);
        cfg.delivery.subject = delivery.value("subject", cfg.delivery.subject);
    }
    return cfg;
}

}
}
