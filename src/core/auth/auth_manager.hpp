#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/auth/auth_code_repository.hpp"
#include "core/auth/auth_guard.hpp"
#include "core/auth/cleanup_scheduler.hpp"
#include "core/auth/code_delivery.hpp"
#include "core/auth/identity_directory.hpp"
#include "core/auth/otp_service.hpp"
#include "core/auth/request_limiter.hpp"
#include "core/auth/session_repository.hpp"
#include "core/auth/session_store.hpp"
#include "core/auth/token_codec.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace labgate {
namespace core {

// 外部协作方; 为空的仓库使用内存实现
struct AuthDependencies {
    std::shared_ptr<IdentityDirectory> identities;
    std::shared_ptr<AuthCodeRepository> codes;
    std::shared_ptr<SessionRepository> sessions;
    std::shared_ptr<RequestLimiter> limiter;
    std::shared_ptr<CodeDelivery> delivery; // 为空表示未配置投递
    std::shared_ptr<const labgate::common::Clock> clock;
};

struct AuthOptions {
    std::string jwt_secret;
    std::chrono::seconds token_ttl = std::chrono::hours(24 * 7);
    OtpOptions otp;
    RequestLimitOptions request_limit;
    CleanupOptions cleanup;
};

// 登录成功后交给调用方的结果
struct LoginResult {
    IdentityRecord identity;
    std::string access_token;
    std::string fingerprint;
};

struct AuthStatus {
    bool authenticated = false;
    IdentityRecord identity;
};

// 登录、状态查询、注销与清理流程
class AuthManager {
public:
    using Status = labgate::common::Status;

    AuthManager(AuthDependencies deps, AuthOptions options);

    // 限流时返回 ResourceExhausted, 并写入 retry_after_seconds
    Status RequestCode(const std::string& email, std::int64_t* retry_after_seconds = nullptr);

    labgate::common::StatusOr<LoginResult> VerifyCode(const std::string& email
                                                      , const std::string& code
                                                      , const std::string& user_agent);

    labgate::common::StatusOr<GuardDecision> Authenticate(const Credentials& credentials) const;

    // 任何失败都视为未登录
    AuthStatus GetStatus(const Credentials& credentials) const;

    // 对调用方总是成功; 吊销失败只记录日志
    void Logout(const Credentials& credentials, bool all_devices);

    labgate::common::StatusOr<CleanupReport> RunCleanup();

    // 登录后在后台触发的节流清理
    std::shared_ptr<CleanupScheduler> Scheduler() const { return scheduler_; }

private:
    AuthDependencies deps_;
    AuthOptions options_;
    std::shared_ptr<const TokenCodec> tokens_;
    std::shared_ptr<SessionStore> sessions_;
    std::unique_ptr<OtpService> otp_;
    std::unique_ptr<AuthGuard> guard_;
    std::shared_ptr<CleanupScheduler> scheduler_;
};

} // namespace core
} // namespace labgate
