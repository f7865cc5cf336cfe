#include "core/auth/auth_manager.hpp"

#include "common/logger.hpp"
#include "core/auth/errors.hpp"
#include "core/auth/fingerprint.hpp"

namespace labgate {
namespace core {

namespace {

// 协作方故障对外只暴露通用文案, 细节写日志
labgate::common::Status Generic(const labgate::common::Status& status) {
    if (labgate::common::IsCollaboratorFailure(status)) {
        return labgate::common::Status(status.Code(), AuthErrorMessage(AuthErrorCode::kServiceFailure));
    }
    return status;
}

} // namespace

AuthManager::AuthManager(AuthDependencies deps, AuthOptions options)
    : deps_(std::move(deps)), options_(std::move(options)) {
    if (!deps_.clock) {
        deps_.clock = std::make_shared<labgate::common::SystemClock>();
    }
    if (!deps_.identities) {
        deps_.identities = std::make_shared<InMemoryIdentityDirectory>();
    }
    if (!deps_.codes) {
        deps_.codes = std::make_shared<InMemoryAuthCodeRepository>();
    }
    if (!deps_.sessions) {
        deps_.sessions = std::make_shared<InMemorySessionRepository>();
    }
    if (!deps_.limiter) {
        deps_.limiter = std::make_shared<InMemoryRequestLimiter>(deps_.clock, options_.request_limit);
    }
    options_.cleanup.token_lifetime = options_.token_ttl;

    tokens_ = std::make_shared<TokenCodec>(deps_.clock, options_.jwt_secret, options_.token_ttl);
    sessions_ = std::make_shared<SessionStore>(deps_.sessions, deps_.clock);
    otp_ = std::make_unique<OtpService>(deps_.codes, deps_.clock, options_.otp);
    guard_ = std::make_unique<AuthGuard>(tokens_, sessions_);
    scheduler_ = std::make_shared<CleanupScheduler>(deps_.codes, deps_.sessions, deps_.clock, options_.cleanup);
}

AuthManager::Status AuthManager::RequestCode(const std::string& email, std::int64_t* retry_after_seconds) {
    if (retry_after_seconds) {
        *retry_after_seconds = 0;
    }
    if (NormalizeEmail(email).empty()) {
        return FromAuthError(AuthErrorCode::kMalformedInput, "Email is required");
    }

    auto identity = deps_.identities->FindByEmail(email);
    if (!identity.IsOk()) {
        if (identity.IsNotFound()) {
            return FromAuthError(AuthErrorCode::kEmailNotFound);
        }
        LABGATE_LOG_ERROR("Identity lookup failed: {}", identity.GetStatus().Message());
        return Generic(identity.GetStatus());
    }
    const auto& student = identity.Value();

    auto limit = deps_.limiter->Check(student.id);
    if (!limit.allowed) {
        LABGATE_LOG_WARN("Auth code request limited for student {}", student.id);
        if (retry_after_seconds) {
            *retry_after_seconds = limit.retry_after_seconds;
        }
        return FromAuthError(AuthErrorCode::kTooManyRequests);
    }

    if (!deps_.delivery) {
        LABGATE_LOG_ERROR("Auth code requested but delivery is not configured");
        return Status::Internal("Email service not configured");
    }

    auto code = otp_->Issue(student.id);
    if (!code.IsOk()) {
        return Generic(code.GetStatus());
    }

    auto delivered = deps_.delivery->Deliver(student, code.Value());
    if (!delivered.IsOk()) {
        LABGATE_LOG_ERROR("Auth code delivery failed for student {}: {}", student.id, delivered.Message());
        return Status::Internal(AuthErrorMessage(AuthErrorCode::kServiceFailure));
    }
    return Status::OK();
}

labgate::common::StatusOr<LoginResult> AuthManager::VerifyCode(const std::string& email
                                                               , const std::string& code
                                                               , const std::string& user_agent) {
    if (NormalizeEmail(email).empty() || code.empty()) {
        return FromAuthError(AuthErrorCode::kMalformedInput);
    }
    // 格式错误的验证码不访问存储
    if (!OtpService::IsWellFormedCode(code)) {
        return FromAuthError(AuthErrorCode::kMalformedInput, "Invalid code format");
    }

    auto identity = deps_.identities->FindByEmail(email);
    if (!identity.IsOk()) {
        if (identity.IsNotFound()) {
            return FromAuthError(AuthErrorCode::kEmailNotFound);
        }
        LABGATE_LOG_ERROR("Identity lookup failed: {}", identity.GetStatus().Message());
        return Generic(identity.GetStatus());
    }

    auto verified = otp_->Verify(identity.Value().id, code);
    if (!verified.IsOk()) {
        return Generic(verified.GetStatus());
    }

    auto fingerprint = GenerateFingerprint(user_agent);
    if (!fingerprint.IsOk()) {
        LABGATE_LOG_ERROR("Fingerprint generation failed: {}", fingerprint.GetStatus().Message());
        return Generic(fingerprint.GetStatus());
    }

    auto session_id = sessions_->Create(identity.Value().id, fingerprint.Value());
    if (!session_id.IsOk()) {
        return Generic(session_id.GetStatus());
    }

    auto token = tokens_->Issue(session_id.Value());
    if (!token.IsOk()) {
        // 令牌签发失败时会话不可用, 立即吊销
        auto revoke = sessions_->Revoke(session_id.Value());
        if (!revoke.IsOk()) {
            LABGATE_LOG_WARN("Failed to revoke orphan session: {}", revoke.Message());
        }
        return Generic(token.GetStatus());
    }

    LoginResult result;
    result.identity = std::move(identity.Value());
    result.access_token = std::move(token.Value());
    result.fingerprint = std::move(fingerprint.Value());
    LABGATE_LOG_INFO("Student {} logged in", result.identity.id);
    return labgate::common::StatusOr<LoginResult>(std::move(result));
}

labgate::common::StatusOr<GuardDecision> AuthManager::Authenticate(const Credentials& credentials) const {
    auto decision = guard_->Evaluate(credentials);
    if (!decision.IsOk()) {
        return Generic(decision.GetStatus());
    }
    return decision;
}

AuthStatus AuthManager::GetStatus(const Credentials& credentials) const {
    AuthStatus status;
    auto decision = guard_->Evaluate(credentials);
    if (!decision.IsOk() || !decision.Value().Authenticated()) {
        return status;
    }
    auto identity = deps_.identities->FindById(decision.Value().student_id);
    if (!identity.IsOk()) {
        LABGATE_LOG_WARN("Authenticated student {} not found in directory: {}"
                         , decision.Value().student_id, identity.GetStatus().Message());
        return status;
    }
    status.authenticated = true;
    status.identity = std::move(identity.Value());
    return status;
}

void AuthManager::Logout(const Credentials& credentials, bool all_devices) {
    if (all_devices) {
        auto decision = guard_->Evaluate(credentials);
        if (!decision.IsOk()) {
            LABGATE_LOG_ERROR("Logout failed to verify session: {}", decision.GetStatus().Message());
            return;
        }
        if (!decision.Value().Authenticated()) {
            // 未完整认证时只吊销令牌指向的会话
            auto revoke = sessions_->Revoke(decision.Value().session_id);
            if (!revoke.IsOk()) {
                LABGATE_LOG_ERROR("Logout revoke failed: {}", revoke.Message());
            }
            return;
        }
        auto revoked = sessions_->RevokeAll(decision.Value().student_id);
        if (!revoked.IsOk()) {
            LABGATE_LOG_ERROR("Logout revoke-all failed: {}", revoked.GetStatus().Message());
        }
        return;
    }

    auto session_id = tokens_->Verify(credentials.access_token);
    if (!session_id.IsOk()) {
        return;
    }
    auto revoke = sessions_->Revoke(session_id.Value());
    if (!revoke.IsOk()) {
        LABGATE_LOG_ERROR("Logout revoke failed: {}", revoke.Message());
    }
}

labgate::common::StatusOr<CleanupReport> AuthManager::RunCleanup() {
    auto report = scheduler_->RunForced();
    if (!report.IsOk()) {
        return Generic(report.GetStatus());
    }
    return report;
}

} // namespace core
} // namespace labgate
