#include "core/auth/request_limiter.hpp"

namespace labgate {
namespace core {

InMemoryRequestLimiter::InMemoryRequestLimiter(std::shared_ptr<const labgate::common::Clock> clock
                                               , RequestLimitOptions options)
    : clock_(std::move(clock)), options_(options) {
    if (!clock_) {
        clock_ = std::make_shared<labgate::common::SystemClock>();
    }
}

LimitDecision InMemoryRequestLimiter::Check(const std::string& key) {
    const auto now = clock_->NowSeconds();
    const auto window = options_.window.count();

    std::lock_guard<std::mutex> lock(mutex_);
    // 顺带回收过期桶, 防止 map 无限增长
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (now - it->second.window_start >= window) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }

    auto& bucket = buckets_[key];
    if (bucket.count == 0) {
        bucket.window_start = now;
    }
    ++bucket.count;

    LimitDecision decision;
    if (bucket.count > options_.max_requests) {
        decision.allowed = false;
        decision.retry_after_seconds = bucket.window_start + window - now;
    }
    return decision;
}

} // namespace core
} // namespace labgate
