#include "core/auth/session_store.hpp"

#include "common/crypto.hpp"
#include "common/logger.hpp"
#include "core/auth/errors.hpp"

namespace labgate {
namespace core {

SessionStore::SessionStore(std::shared_ptr<SessionRepository> repository
                           , std::shared_ptr<const labgate::common::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
    if (!repository_) {
        repository_ = std::make_shared<InMemorySessionRepository>();
    }
    if (!clock_) {
        clock_ = std::make_shared<labgate::common::SystemClock>();
    }
}

labgate::common::StatusOr<std::string> SessionStore::Create(const std::string& student_id
                                                            , const std::string& fingerprint) {
    if (student_id.empty() || fingerprint.empty()) {
        return Status::InvalidArgument("student id and fingerprint are required");
    }
    auto id_or = labgate::common::RandomUuid();
    if (!id_or.IsOk()) {
        return id_or.GetStatus();
    }

    SessionRecord record;
    record.id = std::move(id_or.Value());
    record.student_id = student_id;
    record.fingerprint = fingerprint;
    record.created_at = clock_->NowSeconds();
    record.last_seen = record.created_at;
    record.revoked = false;

    auto status = repository_->Insert(record);
    if (!status.IsOk()) {
        LABGATE_LOG_ERROR("Failed to create session for student {}: {}", student_id, status.Message());
        // 插入失败对登录是致命的, 统一按服务错误处理
        if (status.Code() == labgate::common::StatusCode::kAlreadyExists) {
            return Status::Internal("Session id collision");
        }
        return status;
    }
    LABGATE_LOG_INFO("Session created for student {}", student_id);
    return labgate::common::StatusOr<std::string>(std::move(record.id));
}

labgate::common::StatusOr<std::string> SessionStore::Verify(const std::string& session_id
                                                            , const std::string& fingerprint) {
    if (session_id.empty() || fingerprint.empty()) {
        return FromAuthError(AuthErrorCode::kUnauthorized);
    }

    auto found = repository_->FindActive(session_id, fingerprint);
    if (!found.IsOk()) {
        if (!found.IsNotFound()) {
            return found.GetStatus();
        }
        auto revoked = repository_->RevokeIfFingerprintMismatch(session_id, fingerprint);
        if (!revoked.IsOk()) {
            return revoked.GetStatus();
        }
        if (revoked.Value()) {
            LABGATE_LOG_WARN("Fingerprint mismatch, session {} revoked", session_id);
        }
        return FromAuthError(AuthErrorCode::kUnauthorized);
    }

    auto touch = repository_->TouchLastSeen(session_id, clock_->NowSeconds());
    if (!touch.IsOk()) {
        LABGATE_LOG_WARN("Failed to update last_seen for session {}: {}", session_id, touch.Message());
    }
    return labgate::common::StatusOr<std::string>(std::move(found.Value().student_id));
}

SessionStore::Status SessionStore::Revoke(const std::string& session_id) {
    if (session_id.empty()) {
        return Status::OK();
    }
    auto status = repository_->Revoke(session_id);
    if (status.IsOk()) {
        LABGATE_LOG_INFO("Session {} revoked", session_id);
    }
    return status;
}

labgate::common::StatusOr<std::size_t> SessionStore::RevokeAll(const std::string& student_id) {
    if (student_id.empty()) {
        return Status::InvalidArgument("student id is required");
    }
    auto count = repository_->RevokeAllForStudent(student_id);
    if (count.IsOk()) {
        LABGATE_LOG_INFO("Revoked {} sessions for student {}", count.Value(), student_id);
    }
    return count;
}

} // namespace core
} // namespace labgate
