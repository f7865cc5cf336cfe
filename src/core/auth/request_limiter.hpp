#pragma once

#include "common/clock.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace labgate {
namespace core {

struct RequestLimitOptions {
    int max_requests = 3;
    std::chrono::seconds window = std::chrono::seconds(600);
};

struct LimitDecision {
    bool allowed = true;
    std::int64_t retry_after_seconds = 0;
};

// 按学生限制验证码请求频率 (固定窗口)
class RequestLimiter {
public:
    virtual ~RequestLimiter() = default;

    // 记录一次请求并返回是否放行; 后端故障时放行
    virtual LimitDecision Check(const std::string& key) = 0;
};

class InMemoryRequestLimiter : public RequestLimiter {
public:
    InMemoryRequestLimiter(std::shared_ptr<const labgate::common::Clock> clock
                           , RequestLimitOptions options = RequestLimitOptions());

    LimitDecision Check(const std::string& key) override;

private:
    struct Bucket {
        std::int64_t window_start = 0;
        int count = 0;
    };

    std::shared_ptr<const labgate::common::Clock> clock_;
    RequestLimitOptions options_;
    std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};

} // namespace core
} // namespace labgate
