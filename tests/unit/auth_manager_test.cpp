#include "core/auth/auth_manager.hpp"
#include "test_clock.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace labgate::core;
using labgate::common::Status;
using labgate::common::StatusCode;
using labgate::common::StatusOr;

namespace {

// 记录投递内容, 代替真实邮件
class RecordingDelivery : public CodeDelivery {
public:
    Status Deliver(const IdentityRecord& recipient, const std::string& code) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            return Status::Unavailable("smtp down");
        }
        recipients.push_back(recipient.email);
        codes.push_back(code);
        return Status::OK();
    }

    std::string LastCode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return codes.empty() ? "" : codes.back();
    }

    bool fail = false;
    std::vector<std::string> recipients;
    std::vector<std::string> codes;

private:
    mutable std::mutex mutex_;
};

class BrokenIdentityDirectory : public IdentityDirectory {
public:
    StatusOr<IdentityRecord> FindByEmail(const std::string&) const override {
        return Status::Unavailable("mysql: Lost connection to server at 10.0.0.5");
    }
    StatusOr<IdentityRecord> FindById(const std::string&) const override {
        return Status::Unavailable("mysql: Lost connection to server at 10.0.0.5");
    }
};

} // namespace

class AuthManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<testutils::ManualClock>();
        identities_ = std::make_shared<InMemoryIdentityDirectory>();
        ASSERT_TRUE(identities_->Add({"S1001", "Alice Chen", "alice@example.edu"}).IsOk());
        ASSERT_TRUE(identities_->Add({"S1002", "Bob Li", "bob@example.edu"}).IsOk());
        codes_ = std::make_shared<InMemoryAuthCodeRepository>();
        sessions_ = std::make_shared<InMemorySessionRepository>();
        delivery_ = std::make_shared<RecordingDelivery>();
        manager_ = MakeManager(delivery_);
    }

    std::unique_ptr<AuthManager> MakeManager(std::shared_ptr<CodeDelivery> delivery) {
        AuthDependencies deps;
        deps.identities = identities_;
        deps.codes = codes_;
        deps.sessions = sessions_;
        deps.delivery = std::move(delivery);
        deps.clock = clock_;
        AuthOptions options;
        options.jwt_secret = "manager-secret";
        return std::make_unique<AuthManager>(std::move(deps), options);
    }

    LoginResult LoginOrFail(const std::string& email, const std::string& user_agent = "UnitTest/1.0") {
        auto status = manager_->RequestCode(email);
        EXPECT_TRUE(status.IsOk()) << status.Message();
        auto login = manager_->VerifyCode(email, delivery_->LastCode(), user_agent);
        EXPECT_TRUE(login.IsOk()) << login.GetStatus().Message();
        return login.Value();
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::shared_ptr<InMemoryIdentityDirectory> identities_;
    std::shared_ptr<InMemoryAuthCodeRepository> codes_;
    std::shared_ptr<InMemorySessionRepository> sessions_;
    std::shared_ptr<RecordingDelivery> delivery_;
    std::unique_ptr<AuthManager> manager_;
};

// 完整登录流程: 请求验证码 -> 核销 -> 查询状态
TEST_F(AuthManagerTest, RequestVerifyAndStatus) {
    auto status = manager_->RequestCode("alice@example.edu");
    ASSERT_TRUE(status.IsOk()) << status.Message();
    ASSERT_EQ(delivery_->codes.size(), 1u);
    EXPECT_EQ(delivery_->recipients[0], "alice@example.edu");

    auto login = manager_->VerifyCode("alice@example.edu", delivery_->LastCode(), "UnitTest/1.0");
    ASSERT_TRUE(login.IsOk()) << login.GetStatus().Message();
    EXPECT_EQ(login.Value().identity.id, "S1001");
    EXPECT_EQ(login.Value().identity.name, "Alice Chen");
    EXPECT_FALSE(login.Value().access_token.empty());
    EXPECT_EQ(login.Value().fingerprint.size(), 64u);
    EXPECT_EQ(sessions_->Size(), 1u);

    auto current = manager_->GetStatus({login.Value().access_token, login.Value().fingerprint});
    EXPECT_TRUE(current.authenticated);
    EXPECT_EQ(current.identity.email, "alice@example.edu");
}

TEST_F(AuthManagerTest, EmailLookupIgnoresCaseAndSpaces) {
    auto login = LoginOrFail("  ALICE@Example.edu ");
    EXPECT_EQ(login.identity.id, "S1001");
}

TEST_F(AuthManagerTest, EmptyEmailRejected) {
    auto status = manager_->RequestCode("   ");
    EXPECT_EQ(status.Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(status.Message(), "Email is required");
}

TEST_F(AuthManagerTest, UnknownEmailRejected) {
    auto status = manager_->RequestCode("nobody@example.edu");
    EXPECT_EQ(status.Code(), StatusCode::kNotFound);
    EXPECT_EQ(status.Message(), "Email not found");
    EXPECT_TRUE(delivery_->codes.empty());

    auto login = manager_->VerifyCode("nobody@example.edu", "123456", "ua");
    EXPECT_EQ(login.GetStatus().Code(), StatusCode::kNotFound);
}

// 第 4 次请求被限流并给出重试时间
TEST_F(AuthManagerTest, RequestCodeRateLimited) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(manager_->RequestCode("alice@example.edu").IsOk());
    }
    std::int64_t retry_after = 0;
    auto status = manager_->RequestCode("alice@example.edu", &retry_after);
    EXPECT_EQ(status.Code(), StatusCode::kResourceExhausted);
    EXPECT_EQ(status.Message(), "Too many requests");
    EXPECT_EQ(retry_after, 600);
    EXPECT_EQ(delivery_->codes.size(), 3u);

    // 其他学生不受影响
    EXPECT_TRUE(manager_->RequestCode("bob@example.edu").IsOk());

    clock_->Advance(std::chrono::minutes(10));
    EXPECT_TRUE(manager_->RequestCode("alice@example.edu").IsOk());
}

// 未配置投递时不生成验证码
TEST_F(AuthManagerTest, MissingDeliveryFailsBeforeIssue) {
    auto manager = MakeManager(nullptr);
    auto status = manager->RequestCode("alice@example.edu");
    EXPECT_EQ(status.Code(), StatusCode::kInternal);
    EXPECT_EQ(status.Message(), "Email service not configured");
    EXPECT_TRUE(codes_->Snapshot().empty());
}

TEST_F(AuthManagerTest, DeliveryFailureIsGeneric) {
    delivery_->fail = true;
    auto status = manager_->RequestCode("alice@example.edu");
    EXPECT_EQ(status.Code(), StatusCode::kInternal);
    EXPECT_EQ(status.Message(), "An error occurred");
}

// 存储故障细节不会透传给调用方
TEST_F(AuthManagerTest, DirectoryFailureIsGeneric) {
    AuthDependencies deps;
    deps.identities = std::make_shared<BrokenIdentityDirectory>();
    deps.delivery = delivery_;
    deps.clock = clock_;
    AuthOptions options;
    options.jwt_secret = "manager-secret";
    AuthManager manager(std::move(deps), options);

    auto status = manager.RequestCode("alice@example.edu");
    EXPECT_EQ(status.Code(), StatusCode::kUnavailable);
    EXPECT_EQ(status.Message(), "An error occurred");
}

TEST_F(AuthManagerTest, WrongCodeRejected) {
    ASSERT_TRUE(manager_->RequestCode("alice@example.edu").IsOk());
    auto code = delivery_->LastCode();
    std::string wrong = code == "999999" ? "999998" : "999999";

    auto login = manager_->VerifyCode("alice@example.edu", wrong, "ua");
    EXPECT_EQ(login.GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(login.GetStatus().Message(), "Invalid code");
    EXPECT_EQ(sessions_->Size(), 0u);

    // 错误尝试不会消耗正确的验证码
    EXPECT_TRUE(manager_->VerifyCode("alice@example.edu", code, "ua").IsOk());
}

TEST_F(AuthManagerTest, MissingFieldsRejected) {
    EXPECT_EQ(manager_->VerifyCode("", "123456", "ua").GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(manager_->VerifyCode("alice@example.edu", "", "ua").GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(manager_->VerifyCode("alice@example.edu", "12ab", "ua").GetStatus().Code(), StatusCode::kInvalidArgument);
}

// 验证码格式错误时直接拒绝, 不查询学生目录
TEST_F(AuthManagerTest, MalformedCodeSkipsDirectory) {
    AuthDependencies deps;
    deps.identities = std::make_shared<BrokenIdentityDirectory>();
    deps.delivery = delivery_;
    deps.clock = clock_;
    AuthOptions options;
    options.jwt_secret = "manager-secret";
    AuthManager manager(std::move(deps), options);

    for (const std::string code : {"12ab56", "12345", "1234567", " 12345"}) {
        auto login = manager.VerifyCode("alice@example.edu", code, "ua");
        EXPECT_EQ(login.GetStatus().Code(), StatusCode::kInvalidArgument) << code;
    }

    // 未知邮箱加错误格式同样报告格式错误
    auto unknown = manager_->VerifyCode("nobody@example.edu", "abc", "ua");
    EXPECT_EQ(unknown.GetStatus().Code(), StatusCode::kInvalidArgument);
}

// 每次登录生成新的会话与指纹
TEST_F(AuthManagerTest, EachLoginCreatesSeparateSession) {
    auto first = LoginOrFail("alice@example.edu");
    clock_->Advance(std::chrono::minutes(11));
    auto second = LoginOrFail("alice@example.edu");
    EXPECT_NE(first.fingerprint, second.fingerprint);
    EXPECT_NE(first.access_token, second.access_token);
    EXPECT_EQ(sessions_->Size(), 2u);
}

// 令牌被拷贝到其他设备时, 会话被吊销
TEST_F(AuthManagerTest, StolenTokenRevokesSession) {
    auto login = LoginOrFail("alice@example.edu");
    auto decision = manager_->Authenticate({login.access_token, std::string(64, 'f')});
    ASSERT_TRUE(decision.IsOk());
    EXPECT_EQ(decision.Value().state, GuardState::kSessionInvalid);

    auto status = manager_->GetStatus({login.access_token, login.fingerprint});
    EXPECT_FALSE(status.authenticated);
}

TEST_F(AuthManagerTest, StatusWithoutCredentials) {
    auto status = manager_->GetStatus({"", ""});
    EXPECT_FALSE(status.authenticated);
    EXPECT_TRUE(status.identity.id.empty());
}

TEST_F(AuthManagerTest, LogoutRevokesCurrentSessionOnly) {
    auto laptop = LoginOrFail("alice@example.edu", "Laptop");
    clock_->Advance(std::chrono::minutes(11));
    auto phone = LoginOrFail("alice@example.edu", "Phone");

    manager_->Logout({laptop.access_token, laptop.fingerprint}, false);
    EXPECT_FALSE(manager_->GetStatus({laptop.access_token, laptop.fingerprint}).authenticated);
    EXPECT_TRUE(manager_->GetStatus({phone.access_token, phone.fingerprint}).authenticated);
}

TEST_F(AuthManagerTest, LogoutAllDevices) {
    auto laptop = LoginOrFail("alice@example.edu", "Laptop");
    clock_->Advance(std::chrono::minutes(11));
    auto phone = LoginOrFail("alice@example.edu", "Phone");
    auto bob = LoginOrFail("bob@example.edu");

    manager_->Logout({phone.access_token, phone.fingerprint}, true);
    EXPECT_FALSE(manager_->GetStatus({laptop.access_token, laptop.fingerprint}).authenticated);
    EXPECT_FALSE(manager_->GetStatus({phone.access_token, phone.fingerprint}).authenticated);
    EXPECT_TRUE(manager_->GetStatus({bob.access_token, bob.fingerprint}).authenticated);
}

// 未完整认证的全设备注销只吊销令牌指向的会话
TEST_F(AuthManagerTest, LogoutAllDevicesRequiresFingerprint) {
    auto laptop = LoginOrFail("alice@example.edu", "Laptop");
    clock_->Advance(std::chrono::minutes(11));
    auto phone = LoginOrFail("alice@example.edu", "Phone");

    manager_->Logout({laptop.access_token, ""}, true);
    EXPECT_FALSE(manager_->GetStatus({laptop.access_token, laptop.fingerprint}).authenticated);
    EXPECT_TRUE(manager_->GetStatus({phone.access_token, phone.fingerprint}).authenticated);
}

TEST_F(AuthManagerTest, LogoutWithGarbageIsNoop) {
    auto login = LoginOrFail("alice@example.edu");
    manager_->Logout({"garbage", "x"}, false);
    manager_->Logout({"", ""}, true);
    EXPECT_TRUE(manager_->GetStatus({login.access_token, login.fingerprint}).authenticated);
}

TEST_F(AuthManagerTest, RunCleanupReportsCounts) {
    LoginOrFail("alice@example.edu");
    clock_->Advance(std::chrono::hours(25));

    auto report = manager_->RunCleanup();
    ASSERT_TRUE(report.IsOk()) << report.GetStatus().Message();
    EXPECT_EQ(report.Value().codes_deleted, 1u);
    EXPECT_EQ(report.Value().sessions_deleted, 0u);
    EXPECT_EQ(manager_->Scheduler()->LastRunSeconds(), clock_->NowSeconds());
}
