#pragma once

#include <string>

namespace labgate {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50061;
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
    int max_file_size_mb = 10;
    int max_files = 3;
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "labgate";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MysqlConfig mysql;
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int socket_timeout_ms = 500;
    bool enabled = false;
};

// 缓存配置结构体
struct CacheConfig {
    RedisConfig redis;
};

// 验证码请求限流配置
struct RequestLimitConfig {
    int max_requests = 3;
    int window_seconds = 600;
};

// 认证配置结构体
struct AuthConfig {
    std::string jwt_secret = "";
    int token_ttl_seconds = 7 * 24 * 3600;
    int code_ttl_seconds = 600;
    int code_lookback_seconds = 900;
    bool secure_cookies = false;
    RequestLimitConfig request_limit;
};

// 清理任务配置结构体
struct CleanupConfig {
    int interval_seconds = 3600;
    int code_retention_hours = 24;
    int revoked_grace_hours = 24;
    std::string api_key = "";
};

// 验证码邮件投递配置
struct DeliveryConfig {
    std::string sendmail_path = "";
    std::string from_address = "no-reply@labgate.local";
    std::string subject = "Your Login Code";
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    StorageConfig storage;
    CacheConfig cache;
    AuthConfig auth;
    CleanupConfig cleanup;
    DeliveryConfig delivery;
};

}
}
