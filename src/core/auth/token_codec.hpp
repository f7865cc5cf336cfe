#pragma once

#include "common/clock.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace labgate {
namespace core {

// HS256 JWT 签发与校验, 令牌只携带会话 id
class TokenCodec {
public:
    static constexpr const char* kIssuer = "labgate";

    TokenCodec(std::shared_ptr<const labgate::common::Clock> clock
               , std::string secret
               , std::chrono::seconds ttl);

    // iat 取注入时钟的当前时间, exp = iat + ttl
    labgate::common::StatusOr<std::string> Issue(const std::string& session_id) const;

    // 校验签名、签发者与过期时间, 失败统一返回 Unauthenticated
    labgate::common::StatusOr<std::string> Verify(const std::string& token) const;

    std::chrono::seconds Ttl() const { return ttl_; }

private:
    std::shared_ptr<const labgate::common::Clock> clock_;
    std::string secret_;
    std::chrono::seconds ttl_;
};

} // namespace core
} // namespace labgate
