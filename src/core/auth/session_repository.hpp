#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace labgate {
namespace core {

// 设备绑定会话记录
struct SessionRecord {
    std::string id;           // UUIDv4
    std::string student_id;
    std::string fingerprint;  // 创建后不可变
    std::int64_t created_at = 0;
    std::int64_t last_seen = 0;
    bool revoked = false;
};

class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    virtual labgate::common::Status Insert(const SessionRecord& record) = 0;

    // 匹配 (id, revoked = false, fingerprint), 无匹配返回 NotFound
    virtual labgate::common::StatusOr<SessionRecord> FindActive(const std::string& id
                                                                , const std::string& fingerprint) const = 0;

    // 条件更新: revoked = true WHERE id AND revoked = false AND fingerprint <> presented
    // 返回值表示是否确实吊销了一条会话
    virtual labgate::common::StatusOr<bool> RevokeIfFingerprintMismatch(const std::string& id
                                                                        , const std::string& fingerprint) = 0;

    virtual labgate::common::Status TouchLastSeen(const std::string& id, std::int64_t now) = 0;

    virtual labgate::common::Status Revoke(const std::string& id) = 0;

    virtual labgate::common::StatusOr<std::size_t> RevokeAllForStudent(const std::string& student_id) = 0;

    // 删除 (已吊销且 created_at < revoked_before) 或 (未吊销且 created_at < active_before) 的会话
    virtual labgate::common::StatusOr<std::size_t> DeleteExpired(std::int64_t revoked_before
                                                                 , std::int64_t active_before) = 0;
};

class InMemorySessionRepository : public SessionRepository {
public:
    labgate::common::Status Insert(const SessionRecord& record) override;
    labgate::common::StatusOr<SessionRecord> FindActive(const std::string& id
                                                        , const std::string& fingerprint) const override;
    labgate::common::StatusOr<bool> RevokeIfFingerprintMismatch(const std::string& id
                                                                , const std::string& fingerprint) override;
    labgate::common::Status TouchLastSeen(const std::string& id, std::int64_t now) override;
    labgate::common::Status Revoke(const std::string& id) override;
    labgate::common::StatusOr<std::size_t> RevokeAllForStudent(const std::string& student_id) override;
    labgate::common::StatusOr<std::size_t> DeleteExpired(std::int64_t revoked_before
                                                         , std::int64_t active_before) override;

    // 按 id 读取 (不论状态)
    labgate::common::StatusOr<SessionRecord> Find(const std::string& id) const;
    std::size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

} // namespace core
} // namespace labgate
