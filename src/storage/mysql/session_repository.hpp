#pragma once

#include "core/auth/session_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace labgate {
namespace storage {

class MySqlSessionRepository : public labgate::core::SessionRepository {
public:
    explicit MySqlSessionRepository(std::shared_ptr<ConnectionPool> pool);

    labgate::common::Status Insert(const labgate::core::SessionRecord& record) override;
    labgate::common::StatusOr<labgate::core::SessionRecord> FindActive(const std::string& id
                                                                       , const std::string& fingerprint) const override;
    labgate::common::StatusOr<bool> RevokeIfFingerprintMismatch(const std::string& id
                                                                , const std::string& fingerprint) override;
    labgate::common::Status TouchLastSeen(const std::string& id, std::int64_t now) override;
    labgate::common::Status Revoke(const std::string& id) override;
    labgate::common::StatusOr<std::size_t> RevokeAllForStudent(const std::string& student_id) override;
    labgate::common::StatusOr<std::size_t> DeleteExpired(std::int64_t revoked_before
                                                         , std::int64_t active_before) override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace labgate
