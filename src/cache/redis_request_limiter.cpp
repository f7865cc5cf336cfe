#include "cache/redis_request_limiter.hpp"

#include "common/logger.hpp"

namespace labgate {
namespace cache {

RedisRequestLimiter::RedisRequestLimiter(std::shared_ptr<RedisClient> redis
                                         , labgate::core::RequestLimitOptions options)
    : redis_(std::move(redis)), options_(options) {}

std::string RedisRequestLimiter::KeyFor(const std::string& key) {
    return "labgate:otp-limit:" + key;
}

labgate::core::LimitDecision RedisRequestLimiter::Check(const std::string& key) {
    labgate::core::LimitDecision decision;
    const auto redis_key = KeyFor(key);
    const auto window = static_cast<int>(options_.window.count());

    auto count = redis_->IncrWithExpire(redis_key, window);
    if (!count.IsOk()) {
        // 限流后端故障时放行
        LABGATE_LOG_WARN("Request limiter unavailable, allowing request: {}", count.GetStatus().Message());
        return decision;
    }
    if (count.Value() <= options_.max_requests) {
        return decision;
    }

    decision.allowed = false;
    decision.retry_after_seconds = window;
    auto ttl = redis_->Ttl(redis_key);
    if (ttl.IsOk() && ttl.Value() >= 0) {
        decision.retry_after_seconds = ttl.Value();
    } else if (!ttl.IsOk()) {
        LABGATE_LOG_WARN("Failed to read limiter TTL: {}", ttl.GetStatus().Message());
    }
    return decision;
}

} // namespace cache
} // namespace labgate
