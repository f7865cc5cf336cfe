#include "cache/redis_client.hpp"

#include <chrono>

namespace labgate {
namespace cache {

RedisClient::RedisClient(const labgate::common::RedisConfig& config)
    : config_(config) {}

RedisClient::~RedisClient() = default;

labgate::common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return labgate::common::Status::Unavailable("Redis is disabled in the configuration.");
    }
    if (redis_) {
        return labgate::common::Status::OK(); // 已经连接
    }

    try {
        sw::redis::ConnectionOptions opts;
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        auto redis = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        redis->ping();
        redis_ = std::move(redis);
        return labgate::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return labgate::common::Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

labgate::common::StatusOr<long long> RedisClient::IncrWithExpire(const std::string& key, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        long long count = redis_->incr(key);
        // 首次计数, 或上次设置过期时间失败留下了永久键
        if (count == 1 || redis_->ttl(key) == -1) {
            redis_->expire(key, std::chrono::seconds(ttl_seconds));
        }
        return labgate::common::StatusOr<long long>(count);
    } catch (const sw::redis::Error& err) {
        return labgate::common::Status::Unavailable("Failed to increment key in Redis: " + std::string(err.what()));
    }
}

labgate::common::StatusOr<long long> RedisClient::Ttl(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        return labgate::common::StatusOr<long long>(redis_->ttl(key));
    } catch (const sw::redis::Error& err) {
        return labgate::common::Status::Unavailable("Failed to read TTL from Redis: " + std::string(err.what()));
    }
}

labgate::common::Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->del(key);
        return labgate::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return labgate::common::Status::Unavailable("Failed to delete key from Redis: " + std::string(err.what()));
    }
}

} // namespace cache
} // namespace labgate
