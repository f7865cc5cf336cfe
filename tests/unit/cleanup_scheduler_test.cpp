#include "core/auth/cleanup_scheduler.hpp"
#include "test_clock.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace labgate::core;
using labgate::common::Status;
using labgate::common::StatusCode;
using labgate::common::StatusOr;

namespace {

constexpr std::int64_t kHour = 3600;

class FlakySessionRepository : public InMemorySessionRepository {
public:
    StatusOr<std::size_t> DeleteExpired(std::int64_t revoked_before, std::int64_t active_before) override {
        if (fail) {
            return Status::Unavailable("database down");
        }
        return InMemorySessionRepository::DeleteExpired(revoked_before, active_before);
    }
    bool fail = false;
};

} // namespace

class CleanupSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<testutils::ManualClock>();
        codes_ = std::make_shared<InMemoryAuthCodeRepository>();
        sessions_ = std::make_shared<FlakySessionRepository>();
        scheduler_ = std::make_unique<CleanupScheduler>(codes_, sessions_, clock_);
    }

    void AddCode(const std::string& id, std::int64_t created_at, bool used) {
        AuthCodeRecord rec;
        rec.id = id;
        rec.student_id = "student-" + id;
        rec.code = "123456";
        rec.created_at = created_at;
        rec.expires_at = created_at + 600;
        rec.used = used;
        ASSERT_TRUE(codes_->ReplaceActiveCode(rec).IsOk());
    }

    void AddSession(const std::string& id, std::int64_t created_at, bool revoked) {
        SessionRecord rec;
        rec.id = id;
        rec.student_id = "s1";
        rec.fingerprint = "fp";
        rec.created_at = created_at;
        rec.last_seen = created_at;
        rec.revoked = revoked;
        ASSERT_TRUE(sessions_->Insert(rec).IsOk());
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::shared_ptr<InMemoryAuthCodeRepository> codes_;
    std::shared_ptr<FlakySessionRepository> sessions_;
    std::unique_ptr<CleanupScheduler> scheduler_;
};

// 验证码按创建时间保留 24 小时, 不论是否使用
TEST_F(CleanupSchedulerTest, RemovesCodesOlderThanRetention) {
    const auto now = clock_->NowSeconds();
    AddCode("old-used", now - 25 * kHour, true);
    AddCode("old-unused", now - 25 * kHour, false);
    AddCode("recent", now - 23 * kHour, true);

    auto report = scheduler_->RunForced();
    ASSERT_TRUE(report.IsOk()) << report.GetStatus().Message();
    EXPECT_EQ(report.Value().codes_deleted, 2u);
    auto remaining = codes_->Snapshot();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, "recent");
}

// 已吊销会话保留 24 小时, 活跃会话保留到令牌有效期结束
TEST_F(CleanupSchedulerTest, AppliesTwoSessionRetentionTiers) {
    const auto now = clock_->NowSeconds();
    AddSession("revoked-old", now - 25 * kHour, true);
    AddSession("revoked-recent", now - 2 * kHour, true);
    AddSession("active-old", now - 8 * 24 * kHour, false);
    AddSession("active-two-days", now - 48 * kHour, false);

    auto report = scheduler_->RunForced();
    ASSERT_TRUE(report.IsOk());
    EXPECT_EQ(report.Value().sessions_deleted, 2u);
    EXPECT_FALSE(report.Value().skipped);

    EXPECT_FALSE(sessions_->Find("revoked-old").IsOk());
    EXPECT_TRUE(sessions_->Find("revoked-recent").IsOk());
    EXPECT_FALSE(sessions_->Find("active-old").IsOk());
    EXPECT_TRUE(sessions_->Find("active-two-days").IsOk());
}

// 距上次运行不足一小时时跳过
TEST_F(CleanupSchedulerTest, LazyRunIsThrottled) {
    EXPECT_EQ(scheduler_->LastRunSeconds(), 0);
    auto first = scheduler_->RunLazy();
    EXPECT_FALSE(first.skipped);
    const auto first_run = scheduler_->LastRunSeconds();
    EXPECT_EQ(first_run, clock_->NowSeconds());

    clock_->Advance(std::chrono::minutes(30));
    AddSession("revoked-old", clock_->NowSeconds() - 25 * kHour, true);
    auto second = scheduler_->RunLazy();
    EXPECT_TRUE(second.skipped);
    EXPECT_EQ(second.sessions_deleted, 0u);
    EXPECT_EQ(scheduler_->LastRunSeconds(), first_run);
    EXPECT_TRUE(sessions_->Find("revoked-old").IsOk());

    clock_->Advance(std::chrono::minutes(30));
    auto third = scheduler_->RunLazy();
    EXPECT_FALSE(third.skipped);
    EXPECT_EQ(third.sessions_deleted, 1u);
}

TEST_F(CleanupSchedulerTest, ForceBypassesThrottle) {
    ASSERT_FALSE(scheduler_->RunLazy().skipped);
    clock_->Advance(std::chrono::minutes(1));
    EXPECT_FALSE(scheduler_->RunLazy(true).skipped);
    EXPECT_TRUE(scheduler_->RunForced().IsOk());
    EXPECT_EQ(scheduler_->LastRunSeconds(), clock_->NowSeconds());
}

// 失败不推进时间戳, 下一次惰性调用会重试
TEST_F(CleanupSchedulerTest, FailureDoesNotAdvanceTimestamp) {
    ASSERT_FALSE(scheduler_->RunLazy().skipped);
    const auto first_run = scheduler_->LastRunSeconds();

    clock_->Advance(std::chrono::hours(2));
    sessions_->fail = true;
    auto forced = scheduler_->RunForced();
    EXPECT_FALSE(forced.IsOk());
    EXPECT_EQ(forced.GetStatus().Code(), StatusCode::kUnavailable);

    // 惰性运行吞掉错误
    auto lazy = scheduler_->RunLazy();
    EXPECT_FALSE(lazy.skipped);
    EXPECT_EQ(lazy.sessions_deleted, 0u);
    EXPECT_EQ(scheduler_->LastRunSeconds(), first_run);

    sessions_->fail = false;
    EXPECT_FALSE(scheduler_->RunLazy().skipped);
    EXPECT_EQ(scheduler_->LastRunSeconds(), clock_->NowSeconds());
}

TEST_F(CleanupSchedulerTest, TokenLifetimeIsConfigurable) {
    CleanupOptions options;
    options.token_lifetime = std::chrono::hours(1);
    CleanupScheduler scheduler(codes_, sessions_, clock_, options);
    AddSession("active", clock_->NowSeconds() - 2 * kHour, false);

    auto report = scheduler.RunForced();
    ASSERT_TRUE(report.IsOk());
    EXPECT_EQ(report.Value().sessions_deleted, 1u);
}
