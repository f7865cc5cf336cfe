#pragma once

#include "core/auth/auth_guard.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace labgate {
namespace server {

constexpr const char* kAccessTokenCookie = "access_token";
constexpr const char* kFingerprintCookie = "fingerprint";

struct CookieOptions {
    bool secure = false;
    std::int64_t max_age_seconds = 7 * 24 * 3600;
};

// Set-Cookie 值: HttpOnly; SameSite=Lax; Path=/; Max-Age
std::string FormatSetCookie(const std::string& name, const std::string& value, const CookieOptions& options);

// 清除 cookie: 空值, Max-Age=0
std::string FormatClearedCookie(const std::string& name, const CookieOptions& options);

// 解析 Cookie 请求头 "a=1; b=2"; 同名时保留第一个
std::map<std::string, std::string> ParseCookieHeader(const std::string& header);

// 从一个或多个 Cookie 头中取出两个凭据
labgate::core::Credentials CredentialsFromCookies(const std::vector<std::string>& headers);

// 登录成功后下发的两个 cookie
std::vector<std::string> CredentialCookies(const std::string& access_token
                                           , const std::string& fingerprint
                                           , const CookieOptions& options);

// 清除两个凭据 cookie
std::vector<std::string> ClearedCredentialCookies(const CookieOptions& options);

} // namespace server
} // namespace labgate
