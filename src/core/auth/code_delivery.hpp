#pragma once

#include "common/status.hpp"
#include "core/auth/identity_directory.hpp"

#include <string>

namespace labgate {
namespace core {

// 验证码带外投递 (邮件等)
class CodeDelivery {
public:
    virtual ~CodeDelivery() = default;

    // 实现不得记录 code 本身
    virtual labgate::common::Status Deliver(const IdentityRecord& recipient, const std::string& code) = 0;
};

} // namespace core
} // namespace labgate
