#pragma once

#include "common/clock.hpp"
#include "common/status_or.hpp"
#include "core/auth/auth_code_repository.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace labgate {
namespace core {

struct OtpOptions {
    std::chrono::seconds code_ttl = std::chrono::seconds(600);
    std::chrono::seconds lookback = std::chrono::seconds(900); // 超出回看窗口的验证码视为不存在
};

// 未命中时的诊断分类, 只用于日志
enum class OtpMissReason {
    kNeverIssued,
    kExpired,
    kConsumed,
};

// 一次性验证码的签发与核销
class OtpService {
public:
    using Status = labgate::common::Status;
    using StatusOrCode = labgate::common::StatusOr<std::string>;

    OtpService(std::shared_ptr<AuthCodeRepository> repository
               , std::shared_ptr<const labgate::common::Clock> clock
               , OtpOptions options = OtpOptions());

    // 生成 6 位验证码, 同一原子操作中作废该学生之前未使用的验证码
    StatusOrCode Issue(const std::string& student_id);

    // 成功时返回 student_id; 格式错误为 InvalidArgument, 不匹配为 Unauthenticated
    StatusOrCode Verify(const std::string& student_id, const std::string& code);

    static bool IsWellFormedCode(const std::string& code);

private:
    OtpMissReason ClassifyMiss(const std::string& student_id, const std::string& code
                               , std::int64_t now, std::int64_t created_after);

    std::shared_ptr<AuthCodeRepository> repository_;
    std::shared_ptr<const labgate::common::Clock> clock_;
    OtpOptions options_;
};

} // namespace core
} // namespace labgate
