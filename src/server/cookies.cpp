#include "server/cookies.hpp"

#include <fmt/format.h>

namespace labgate {
namespace server {

namespace {

std::string Trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::string Attributes(const CookieOptions& options, std::int64_t max_age) {
    return fmt::format("Path=/; Max-Age={}; HttpOnly; SameSite=Lax{}"
                       , max_age, options.secure ? "; Secure" : "");
}

} // namespace

std::string FormatSetCookie(const std::string& name, const std::string& value, const CookieOptions& options) {
    return fmt::format("{}={}; {}", name, value, Attributes(options, options.max_age_seconds));
}

std::string FormatClearedCookie(const std::string& name, const CookieOptions& options) {
    return fmt::format("{}=; {}", name, Attributes(options, 0));
}

std::map<std::string, std::string> ParseCookieHeader(const std::string& header) {
    std::map<std::string, std::string> cookies;
    std::size_t pos = 0;
    while (pos <= header.size()) {
        auto next = header.find(';', pos);
        if (next == std::string::npos) {
            next = header.size();
        }
        auto pair = header.substr(pos, next - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            auto name = Trim(pair.substr(0, eq));
            auto value = Trim(pair.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (!name.empty()) {
                cookies.emplace(std::move(name), std::move(value));
            }
        }
        pos = next + 1;
    }
    return cookies;
}

labgate::core::Credentials CredentialsFromCookies(const std::vector<std::string>& headers) {
    labgate::core::Credentials credentials;
    for (const auto& header : headers) {
        auto cookies = ParseCookieHeader(header);
        auto token = cookies.find(kAccessTokenCookie);
        if (credentials.access_token.empty() && token != cookies.end()) {
            credentials.access_token = token->second;
        }
        auto fingerprint = cookies.find(kFingerprintCookie);
        if (credentials.fingerprint.empty() && fingerprint != cookies.end()) {
            credentials.fingerprint = fingerprint->second;
        }
    }
    return credentials;
}

std::vector<std::string> CredentialCookies(const std::string& access_token
                                           , const std::string& fingerprint
                                           , const CookieOptions& options) {
    return {FormatSetCookie(kAccessTokenCookie, access_token, options)
            , FormatSetCookie(kFingerprintCookie, fingerprint, options)};
}

std::vector<std::string> ClearedCredentialCookies(const CookieOptions& options) {
    return {FormatClearedCookie(kAccessTokenCookie, options)
            , FormatClearedCookie(kFingerprintCookie, options)};
}

} // namespace server
} // namespace labgate
