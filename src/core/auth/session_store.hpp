#pragma once

#include "common/clock.hpp"
#include "common/status_or.hpp"
#include "core/auth/session_repository.hpp"

#include <memory>
#include <string>

namespace labgate {
namespace core {

// 会话生命周期: 创建、带指纹校验、吊销
class SessionStore {
public:
    using Status = labgate::common::Status;

    SessionStore(std::shared_ptr<SessionRepository> repository
                 , std::shared_ptr<const labgate::common::Clock> clock);

    // 返回新会话 id
    labgate::common::StatusOr<std::string> Create(const std::string& student_id
                                                  , const std::string& fingerprint);

    // 返回会话所属 student_id; 指纹不符时吊销该会话 (失败即关闭)
    labgate::common::StatusOr<std::string> Verify(const std::string& session_id
                                                  , const std::string& fingerprint);

    // 不存在的会话也视为成功
    Status Revoke(const std::string& session_id);
    labgate::common::StatusOr<std::size_t> RevokeAll(const std::string& student_id);

private:
    std::shared_ptr<SessionRepository> repository_;
    std::shared_ptr<const labgate::common::Clock> clock_;
};

} // namespace core
} // namespace labgate
