#include "storage/mysql/session_repository.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace labgate {
namespace storage {

namespace {

labgate::common::Status MapInsertError(MYSQL* conn) {
    if (mysql_errno(conn) == 1062) { // duplicate
        return labgate::common::Status::AlreadyExists("Session already exists");
    }
    return MapMySqlError(conn, "insert session failed");
}

} // namespace

MySqlSessionRepository::MySqlSessionRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

labgate::common::Status MySqlSessionRepository::Insert(const labgate::core::SessionRecord& record) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto sql = fmt::format(
        "INSERT INTO sessions (id, student_id, fingerprint, created_at, last_seen, revoked) "
        "VALUES ('{}', '{}', '{}', FROM_UNIXTIME({}), FROM_UNIXTIME({}), {})",
        lease->Escape(record.id),
        lease->Escape(record.student_id),
        lease->Escape(record.fingerprint),
        record.created_at,
        record.last_seen,
        record.revoked ? 1 : 0);
    if (mysql_real_query(lease.Raw(), sql.c_str(), sql.size()) != 0) {
        return MapInsertError(lease.Raw());
    }
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<labgate::core::SessionRecord> MySqlSessionRepository::FindActive(const std::string& id
                                                                                          , const std::string& fingerprint) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto res = lease->Query(fmt::format(
        "SELECT id, student_id, fingerprint, UNIX_TIMESTAMP(created_at), UNIX_TIMESTAMP(last_seen) "
        "FROM sessions WHERE id = '{}' AND revoked = 0 AND fingerprint = '{}' LIMIT 1",
        lease->Escape(id), lease->Escape(fingerprint)));
    if (!res.IsOk()) {
        return res.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res.Value().get());
    if (!row || !row[0]) {
        return labgate::common::Status::NotFound("Session not found");
    }
    labgate::core::SessionRecord rec;
    rec.id = row[0];
    rec.student_id = row[1] ? row[1] : "";
    rec.fingerprint = row[2] ? row[2] : "";
    rec.created_at = row[3] ? std::strtoll(row[3], nullptr, 10) : 0;
    rec.last_seen = row[4] ? std::strtoll(row[4], nullptr, 10) : 0;
    rec.revoked = false;
    return labgate::common::StatusOr<labgate::core::SessionRecord>(std::move(rec));
}

labgate::common::StatusOr<bool> MySqlSessionRepository::RevokeIfFingerprintMismatch(const std::string& id
                                                                                    , const std::string& fingerprint) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format(
        "UPDATE sessions SET revoked = 1 "
        "WHERE id = '{}' AND revoked = 0 AND fingerprint <> '{}'",
        lease->Escape(id), lease->Escape(fingerprint)));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::StatusOr<bool>(affected.Value() > 0);
}

labgate::common::Status MySqlSessionRepository::TouchLastSeen(const std::string& id, std::int64_t now) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format(
        "UPDATE sessions SET last_seen = FROM_UNIXTIME({}) WHERE id = '{}'", now, lease->Escape(id)));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::Status::OK();
}

labgate::common::Status MySqlSessionRepository::Revoke(const std::string& id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format(
        "UPDATE sessions SET revoked = 1 WHERE id = '{}'", lease->Escape(id)));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<std::size_t> MySqlSessionRepository::RevokeAllForStudent(const std::string& student_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format(
        "UPDATE sessions SET revoked = 1 WHERE student_id = '{}' AND revoked = 0", lease->Escape(student_id)));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::StatusOr<std::size_t>(static_cast<std::size_t>(affected.Value()));
}

labgate::common::StatusOr<std::size_t> MySqlSessionRepository::DeleteExpired(std::int64_t revoked_before
                                                                            , std::int64_t active_before) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format(
        "DELETE FROM sessions "
        "WHERE (revoked = 1 AND created_at < FROM_UNIXTIME({})) "
        "OR (revoked = 0 AND created_at < FROM_UNIXTIME({}))",
        revoked_before, active_before));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::StatusOr<std::size_t>(static_cast<std::size_t>(affected.Value()));
}

} // namespace storage
} // namespace labgate
