#pragma once

#include "cache/redis_client.hpp"
#include "core/auth/request_limiter.hpp"

#include <memory>
#include <string>

namespace labgate {
namespace cache {

// 基于 Redis INCR/EXPIRE 的多实例共享限流
class RedisRequestLimiter : public labgate::core::RequestLimiter {
public:
    RedisRequestLimiter(std::shared_ptr<RedisClient> redis
                        , labgate::core::RequestLimitOptions options = labgate::core::RequestLimitOptions());

    labgate::core::LimitDecision Check(const std::string& key) override;

    static std::string KeyFor(const std::string& key);

private:
    std::shared_ptr<RedisClient> redis_;
    labgate::core::RequestLimitOptions options_;
};

} // namespace cache
} // namespace labgate
