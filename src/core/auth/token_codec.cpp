#include "core/auth/token_codec.hpp"

#include "common/logger.hpp"

#include <jwt-cpp/jwt.h>

#include <exception>

namespace labgate {
namespace core {

namespace {

// 过期校验与签发使用同一个注入时钟
struct VerifyClock {
    const labgate::common::Clock* clock;
    jwt::date now() const { return clock->Now(); }
};

} // namespace

TokenCodec::TokenCodec(std::shared_ptr<const labgate::common::Clock> clock
                       , std::string secret
                       , std::chrono::seconds ttl)
    : clock_(std::move(clock)), secret_(std::move(secret)), ttl_(ttl) {
    if (!clock_) {
        clock_ = std::make_shared<labgate::common::SystemClock>();
    }
}

labgate::common::StatusOr<std::string> TokenCodec::Issue(const std::string& session_id) const {
    if (session_id.empty()) {
        return labgate::common::Status::InvalidArgument("session id is required");
    }
    try {
        const auto now = clock_->Now();
        auto token = jwt::create()
            .set_type("JWT")
            .set_issuer(kIssuer)
            .set_issued_at(now)
            .set_expires_at(now + ttl_)
            .set_payload_claim("session_id", jwt::claim(session_id))
            .sign(jwt::algorithm::hs256{secret_});
        return labgate::common::StatusOr<std::string>(std::move(token));
    } catch (const std::exception& ex) {
        LABGATE_LOG_ERROR("Token signing failed: {}", ex.what());
        return labgate::common::Status::Internal("Token signing failed");
    }
}

labgate::common::StatusOr<std::string> TokenCodec::Verify(const std::string& token) const {
    if (token.empty()) {
        return labgate::common::Status::Unauthenticated("Token missing");
    }
    try {
        auto decoded = jwt::decode(token);
        jwt::verify<VerifyClock, jwt::traits::kazuho_picojson>(VerifyClock{clock_.get()})
            .allow_algorithm(jwt::algorithm::hs256{secret_})
            .with_issuer(kIssuer)
            .verify(decoded);
        if (!decoded.has_payload_claim("session_id")) {
            return labgate::common::Status::Unauthenticated("Token has no session");
        }
        auto claim = decoded.get_payload_claim("session_id");
        if (claim.get_type() != jwt::json::type::string) {
            return labgate::common::Status::Unauthenticated("Token has no session");
        }
        auto session_id = claim.as_string();
        if (session_id.empty()) {
            return labgate::common::Status::Unauthenticated("Token has no session");
        }
        return labgate::common::StatusOr<std::string>(std::move(session_id));
    } catch (const std::exception& ex) {
        // 签名错误、过期、格式错误都归为无效令牌
        LABGATE_LOG_DEBUG("Token rejected: {}", ex.what());
        return labgate::common::Status::Unauthenticated("Token invalid");
    }
}

} // namespace core
} // namespace labgate
