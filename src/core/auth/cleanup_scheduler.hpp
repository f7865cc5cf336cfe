#pragma once

#include "common/clock.hpp"
#include "common/status_or.hpp"
#include "core/auth/auth_code_repository.hpp"
#include "core/auth/session_repository.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>

namespace labgate {
namespace core {

struct CleanupOptions {
    std::chrono::seconds interval = std::chrono::hours(1);
    std::chrono::seconds code_retention = std::chrono::hours(24);
    std::chrono::seconds revoked_grace = std::chrono::hours(24);
    std::chrono::seconds token_lifetime = std::chrono::hours(24 * 7);
};

struct CleanupReport {
    std::size_t sessions_deleted = 0;
    std::size_t codes_deleted = 0;
    bool skipped = false;
};

// 节流的过期数据清理, 每个进程一个实例
class CleanupScheduler {
public:
    CleanupScheduler(std::shared_ptr<AuthCodeRepository> codes
                     , std::shared_ptr<SessionRepository> sessions
                     , std::shared_ptr<const labgate::common::Clock> clock
                     , CleanupOptions options = CleanupOptions());

    // 距上次成功运行不足 interval 时跳过; 错误只记录日志, 不向上抛
    CleanupReport RunLazy(bool force = false);

    // 无条件执行, 错误返回给调用方
    labgate::common::StatusOr<CleanupReport> RunForced();

    // 上次成功运行的时间 (秒), 从未运行为 0
    std::int64_t LastRunSeconds() const;

private:
    labgate::common::StatusOr<CleanupReport> Execute(std::int64_t now);

    std::shared_ptr<AuthCodeRepository> codes_;
    std::shared_ptr<SessionRepository> sessions_;
    std::shared_ptr<const labgate::common::Clock> clock_;
    CleanupOptions options_;

    mutable std::mutex mutex_;
    std::int64_t last_run_ = 0;
    bool has_run_ = false;
};

} // namespace core
} // namespace labgate
