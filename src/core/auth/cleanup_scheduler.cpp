#include "core/auth/cleanup_scheduler.hpp"

#include "common/logger.hpp"

#include <utility>

namespace labgate {
namespace core {

CleanupScheduler::CleanupScheduler(std::shared_ptr<AuthCodeRepository> codes
                                   , std::shared_ptr<SessionRepository> sessions
                                   , std::shared_ptr<const labgate::common::Clock> clock
                                   , CleanupOptions options)
    : codes_(std::move(codes))
    , sessions_(std::move(sessions))
    , clock_(std::move(clock))
    , options_(options) {
    if (!clock_) {
        clock_ = std::make_shared<labgate::common::SystemClock>();
    }
}

CleanupReport CleanupScheduler::RunLazy(bool force) {
    const auto now = clock_->NowSeconds();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!force && has_run_ && now - last_run_ < options_.interval.count()) {
            CleanupReport report;
            report.skipped = true;
            return report;
        }
    }

    auto result = Execute(now);
    if (!result.IsOk()) {
        LABGATE_LOG_ERROR("Lazy cleanup failed: {}", result.GetStatus().Message());
    }
    return std::move(result).ValueOr(CleanupReport{});
}

labgate::common::StatusOr<CleanupReport> CleanupScheduler::RunForced() {
    auto result = Execute(clock_->NowSeconds());
    if (!result.IsOk()) {
        LABGATE_LOG_ERROR("Forced cleanup failed: {}", result.GetStatus().Message());
    }
    return result;
}

std::int64_t CleanupScheduler::LastRunSeconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_run_ ? last_run_ : 0;
}

labgate::common::StatusOr<CleanupReport> CleanupScheduler::Execute(std::int64_t now) {
    if (!codes_ || !sessions_) {
        return labgate::common::Status::Internal("Cleanup repositories not configured");
    }

    auto codes_deleted = codes_->DeleteCreatedBefore(now - options_.code_retention.count());
    if (!codes_deleted.IsOk()) {
        return codes_deleted.GetStatus();
    }
    auto sessions_deleted = sessions_->DeleteExpired(now - options_.revoked_grace.count()
                                                     , now - options_.token_lifetime.count());
    if (!sessions_deleted.IsOk()) {
        return sessions_deleted.GetStatus();
    }

    {
        // 只有成功才推进时间戳
        std::lock_guard<std::mutex> lock(mutex_);
        last_run_ = now;
        has_run_ = true;
    }

    CleanupReport report;
    report.codes_deleted = codes_deleted.Value();
    report.sessions_deleted = sessions_deleted.Value();
    LABGATE_LOG_INFO("Cleanup removed {} sessions and {} auth codes"
                     , report.sessions_deleted, report.codes_deleted);
    return labgate::common::StatusOr<CleanupReport>(report);
}

} // namespace core
} // namespace labgate
