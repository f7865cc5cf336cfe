#pragma once

#include "common/status_or.hpp"
#include "core/auth/session_store.hpp"
#include "core/auth/token_codec.hpp"

#include <memory>
#include <string>

namespace labgate {
namespace core {

// 请求携带的两个凭据
struct Credentials {
    std::string access_token;
    std::string fingerprint;
};

enum class GuardState {
    kNoToken,
    kTokenInvalid,   // 签名错误或已过期
    kNoFingerprint,
    kSessionInvalid, // 会话不存在、已吊销或指纹不符
    kAuthenticated,
};

struct GuardDecision {
    GuardState state = GuardState::kNoToken;
    std::string session_id;  // 令牌可解析时填充
    std::string student_id;  // 仅 kAuthenticated 时填充

    bool Authenticated() const { return state == GuardState::kAuthenticated; }
    // 所有未认证结果都要求调用方清除两个 cookie
    bool ShouldClearCredentials() const { return state != GuardState::kAuthenticated; }
};

const char* GuardStateName(GuardState state);

// 请求期认证: 令牌 -> 会话 id -> 带指纹的会话校验
class AuthGuard {
public:
    AuthGuard(std::shared_ptr<const TokenCodec> tokens, std::shared_ptr<SessionStore> sessions);

    // 存储故障时返回错误状态, 而不是未认证
    labgate::common::StatusOr<GuardDecision> Evaluate(const Credentials& credentials) const;

private:
    std::shared_ptr<const TokenCodec> tokens_;
    std::shared_ptr<SessionStore> sessions_;
};

} // namespace core
} // namespace labgate
