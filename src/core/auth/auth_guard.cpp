#include "core/auth/auth_guard.hpp"

#include "common/logger.hpp"

namespace labgate {
namespace core {

const char* GuardStateName(GuardState state) {
    switch (state) {
        case GuardState::kNoToken:
            return "no_token";
        case GuardState::kTokenInvalid:
            return "token_invalid";
        case GuardState::kNoFingerprint:
            return "no_fingerprint";
        case GuardState::kSessionInvalid:
            return "session_invalid";
        case GuardState::kAuthenticated:
            return "authenticated";
    }
    return "unknown";
}

AuthGuard::AuthGuard(std::shared_ptr<const TokenCodec> tokens, std::shared_ptr<SessionStore> sessions)
    : tokens_(std::move(tokens)), sessions_(std::move(sessions)) {}

labgate::common::StatusOr<GuardDecision> AuthGuard::Evaluate(const Credentials& credentials) const {
    GuardDecision decision;
    if (credentials.access_token.empty()) {
        decision.state = GuardState::kNoToken;
        return labgate::common::StatusOr<GuardDecision>(decision);
    }

    auto session_id = tokens_->Verify(credentials.access_token);
    if (!session_id.IsOk()) {
        decision.state = GuardState::kTokenInvalid;
        return labgate::common::StatusOr<GuardDecision>(decision);
    }
    decision.session_id = session_id.Value();

    if (credentials.fingerprint.empty()) {
        decision.state = GuardState::kNoFingerprint;
        return labgate::common::StatusOr<GuardDecision>(decision);
    }

    auto student_id = sessions_->Verify(decision.session_id, credentials.fingerprint);
    if (!student_id.IsOk()) {
        if (student_id.IsCollaboratorFailure()) {
            LABGATE_LOG_ERROR("Session verification failed: {}", student_id.GetStatus().Message());
            return student_id.GetStatus();
        }
        decision.state = GuardState::kSessionInvalid;
        return labgate::common::StatusOr<GuardDecision>(decision);
    }

    decision.state = GuardState::kAuthenticated;
    decision.student_id = std::move(student_id.Value());
    return labgate::common::StatusOr<GuardDecision>(decision);
}

} // namespace core
} // namespace labgate
