#pragma once

#include "common/config.hpp"
#include "common/status_or.hpp"
#include "core/auth/code_delivery.hpp"

#include <string>

namespace labgate {
namespace delivery {

// 通过 sendmail 兼容程序 (sendmail -t -i) 投递验证码邮件
class SendmailCodeDelivery : public labgate::core::CodeDelivery {
public:
    explicit SendmailCodeDelivery(labgate::common::DeliveryConfig config);

    labgate::common::Status Deliver(const labgate::core::IdentityRecord& recipient
                                    , const std::string& code) override;

    // 生成 RFC 5322 纯文本邮件; 地址中含换行时拒绝
    labgate::common::StatusOr<std::string> BuildMessage(const labgate::core::IdentityRecord& recipient
                                                        , const std::string& code) const;

private:
    labgate::common::DeliveryConfig config_;
};

} // namespace delivery
} // namespace labgate
