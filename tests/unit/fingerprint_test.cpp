#include "core/auth/fingerprint.hpp"

#include <gtest/gtest.h>

#include <string>

using labgate::core::GenerateFingerprint;

// 指纹为 64 位小写十六进制
TEST(FingerprintTest, IsLowercaseSha256Hex) {
    auto fp = GenerateFingerprint("Mozilla/5.0 (X11; Linux x86_64)");
    ASSERT_TRUE(fp.IsOk()) << fp.GetStatus().Message();
    EXPECT_EQ(fp.Value().size(), 64u);
    EXPECT_EQ(fp.Value().find_first_not_of("0123456789abcdef"), std::string::npos);
}

// 同一 User-Agent 两次生成的指纹不同
TEST(FingerprintTest, SameUserAgentGivesDistinctValues) {
    auto a = GenerateFingerprint("agent");
    auto b = GenerateFingerprint("agent");
    ASSERT_TRUE(a.IsOk());
    ASSERT_TRUE(b.IsOk());
    EXPECT_NE(a.Value(), b.Value());
}

TEST(FingerprintTest, EmptyUserAgentIsAccepted) {
    auto fp = GenerateFingerprint("");
    ASSERT_TRUE(fp.IsOk());
    EXPECT_EQ(fp.Value().size(), 64u);
}
