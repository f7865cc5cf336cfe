#include "core/auth/token_codec.hpp"
#include "test_clock.hpp"

#include <gtest/gtest.h>
#include <jwt-cpp/jwt.h>

#include <chrono>
#include <memory>

using namespace labgate::core;
using labgate::common::StatusCode;

class TokenCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = std::make_unique<TokenCodec>(std::make_shared<labgate::common::SystemClock>()
                                              , "unit-test-secret"
                                              , std::chrono::hours(24 * 7));
    }

    std::unique_ptr<TokenCodec> codec_;
};

// 签发后可以解析出原会话 id
TEST_F(TokenCodecTest, IssueAndVerify) {
    auto token = codec_->Issue("session-1");
    ASSERT_TRUE(token.IsOk()) << token.GetStatus().Message();
    EXPECT_FALSE(token.Value().empty());

    auto session_id = codec_->Verify(token.Value());
    ASSERT_TRUE(session_id.IsOk()) << session_id.GetStatus().Message();
    EXPECT_EQ(session_id.Value(), "session-1");
}

// 令牌中只有会话 id, 并带有签发者与过期时间
TEST_F(TokenCodecTest, CarriesIssuerAndExpiry) {
    auto token = codec_->Issue("session-2");
    ASSERT_TRUE(token.IsOk());
    auto decoded = jwt::decode(token.Value());
    EXPECT_EQ(decoded.get_issuer(), TokenCodec::kIssuer);
    EXPECT_EQ(decoded.get_algorithm(), "HS256");
    auto lifetime = decoded.get_expires_at() - decoded.get_issued_at();
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::hours>(lifetime).count(), 24 * 7);
}

TEST_F(TokenCodecTest, EmptySessionIdRejected) {
    auto token = codec_->Issue("");
    EXPECT_FALSE(token.IsOk());
    EXPECT_EQ(token.GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST_F(TokenCodecTest, WrongSecretRejected) {
    TokenCodec other(std::make_shared<labgate::common::SystemClock>(), "another-secret", std::chrono::hours(1));
    auto token = other.Issue("session-1");
    ASSERT_TRUE(token.IsOk());

    auto result = codec_->Verify(token.Value());
    EXPECT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kUnauthenticated);
}

// 签发时间在过去, 已超过有效期
TEST_F(TokenCodecTest, ExpiredTokenRejected) {
    auto past = std::make_shared<testutils::ManualClock>();
    past->Set(std::chrono::duration_cast<std::chrono::seconds>(
                  (std::chrono::system_clock::now() - std::chrono::hours(24 * 8)).time_since_epoch()).count());
    TokenCodec old_codec(past, "unit-test-secret", std::chrono::hours(24 * 7));
    auto token = old_codec.Issue("session-1");
    ASSERT_TRUE(token.IsOk());

    auto result = codec_->Verify(token.Value());
    EXPECT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(TokenCodecTest, MalformedTokenRejected) {
    for (const std::string token : {"", "garbage", "a.b.c", "eyJhbGciOiJIUzI1NiJ9.e30."}) {
        auto result = codec_->Verify(token);
        EXPECT_FALSE(result.IsOk()) << token;
        EXPECT_EQ(result.GetStatus().Code(), StatusCode::kUnauthenticated) << token;
    }
}

// 篡改载荷后签名失效
TEST_F(TokenCodecTest, TamperedPayloadRejected) {
    auto token = codec_->Issue("session-1");
    ASSERT_TRUE(token.IsOk());
    auto other = codec_->Issue("session-2");
    ASSERT_TRUE(other.IsOk());

    const auto& a = token.Value();
    const auto& b = other.Value();
    // 拼接 a 的头、b 的载荷与 a 的签名
    auto forged = a.substr(0, a.find('.')) + b.substr(b.find('.'), b.rfind('.') - b.find('.')) + a.substr(a.rfind('.'));
    auto result = codec_->Verify(forged);
    EXPECT_FALSE(result.IsOk());
}

TEST_F(TokenCodecTest, WrongIssuerRejected) {
    auto token = jwt::create()
        .set_type("JWT")
        .set_issuer("someone-else")
        .set_issued_at(std::chrono::system_clock::now())
        .set_expires_at(std::chrono::system_clock::now() + std::chrono::hours(1))
        .set_payload_claim("session_id", jwt::claim(std::string("session-1")))
        .sign(jwt::algorithm::hs256{"unit-test-secret"});

    auto result = codec_->Verify(token);
    EXPECT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(TokenCodecTest, MissingSessionClaimRejected) {
    auto token = jwt::create()
        .set_type("JWT")
        .set_issuer(TokenCodec::kIssuer)
        .set_issued_at(std::chrono::system_clock::now())
        .set_expires_at(std::chrono::system_clock::now() + std::chrono::hours(1))
        .sign(jwt::algorithm::hs256{"unit-test-secret"});

    auto result = codec_->Verify(token);
    EXPECT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kUnauthenticated);
}

// 过期判断使用注入的时钟
TEST(TokenCodecClockTest, ExpiresAfterTtl) {
    auto clock = std::make_shared<testutils::ManualClock>();
    TokenCodec codec(clock, "unit-test-secret", std::chrono::hours(1));
    auto token = codec.Issue("session-1");
    ASSERT_TRUE(token.IsOk());

    clock->Advance(std::chrono::minutes(59));
    EXPECT_TRUE(codec.Verify(token.Value()).IsOk());

    clock->Advance(std::chrono::minutes(2));
    auto result = codec.Verify(token.Value());
    EXPECT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kUnauthenticated);
}
