#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

// Redis++库头文件
#include <sw/redis++/redis++.h>

#include <memory>
#include <string>

namespace labgate {
namespace cache {

class RedisClient {
public:
    explicit RedisClient(const labgate::common::RedisConfig& config);
    ~RedisClient();

    // 建立连接池, 并用 PING 确认服务可达
    labgate::common::Status Connect();

    // 计数加一; 若为窗口内首次计数则设置过期时间
    labgate::common::StatusOr<long long> IncrWithExpire(const std::string& key, int ttl_seconds);

    // 剩余过期秒数; 键不存在或无过期时间时返回负数
    labgate::common::StatusOr<long long> Ttl(const std::string& key);

    labgate::common::Status Del(const std::string& key);

private:
    labgate::common::RedisConfig config_;
    std::shared_ptr<sw::redis::Redis> redis_;
};

} // namespace cache
} // namespace labgate
