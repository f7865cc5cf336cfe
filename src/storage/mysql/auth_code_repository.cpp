#include "storage/mysql/auth_code_repository.hpp"

#include "storage/mysql/transaction.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace labgate {
namespace storage {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, student_id, code, UNIX_TIMESTAMP(created_at), UNIX_TIMESTAMP(expires_at), used "
    "FROM auth_codes ";

labgate::core::AuthCodeRecord ParseRow(MYSQL_ROW row) {
    labgate::core::AuthCodeRecord rec;
    rec.id = row[0] ? row[0] : "";
    rec.student_id = row[1] ? row[1] : "";
    rec.code = row[2] ? row[2] : "";
    rec.created_at = row[3] ? std::strtoll(row[3], nullptr, 10) : 0;
    rec.expires_at = row[4] ? std::strtoll(row[4], nullptr, 10) : 0;
    rec.used = row[5] && std::strtol(row[5], nullptr, 10) != 0;
    return rec;
}

} // namespace

MySqlAuthCodeRepository::MySqlAuthCodeRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

labgate::common::Status MySqlAuthCodeRepository::ReplaceActiveCode(const labgate::core::AuthCodeRecord& record) {
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    auto& conn = tx.Conn();
    const auto student_id = conn.Escape(record.student_id);

    // 锁定学生行, 串行化同一学生的并发签发
    auto locked = conn.Query(fmt::format("SELECT id FROM students WHERE id = '{}' FOR UPDATE", student_id));
    if (!locked.IsOk()) {
        return locked.GetStatus();
    }
    if (mysql_num_rows(locked.Value().get()) == 0) {
        return labgate::common::Status::NotFound("Student not found");
    }

    auto deleted = conn.Execute(fmt::format(
        "DELETE FROM auth_codes WHERE student_id = '{}' AND used = 0", student_id));
    if (!deleted.IsOk()) {
        return deleted.GetStatus();
    }

    auto inserted = conn.Execute(fmt::format(
        "INSERT INTO auth_codes (id, student_id, code, created_at, expires_at, used) "
        "VALUES ('{}', '{}', '{}', FROM_UNIXTIME({}), FROM_UNIXTIME({}), 0)",
        conn.Escape(record.id),
        student_id,
        conn.Escape(record.code),
        record.created_at,
        record.expires_at));
    if (!inserted.IsOk()) {
        return inserted.GetStatus();
    }
    return tx.Commit();
}

labgate::common::StatusOr<labgate::core::AuthCodeRecord> MySqlAuthCodeRepository::FindOne(Connection& conn
                                                                                         , const std::string& where) const {
    auto res = conn.Query(std::string(kSelectColumns) + where + " ORDER BY created_at DESC LIMIT 1");
    if (!res.IsOk()) {
        return res.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res.Value().get());
    if (!row) {
        return labgate::common::Status::NotFound("Auth code not found");
    }
    return labgate::common::StatusOr<labgate::core::AuthCodeRecord>(ParseRow(row));
}

labgate::common::StatusOr<labgate::core::AuthCodeRecord> MySqlAuthCodeRepository::FindUsable(const std::string& student_id
                                                                                            , const std::string& code
                                                                                            , std::int64_t now
                                                                                            , std::int64_t created_after) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    return FindOne(*lease, fmt::format(
        "WHERE student_id = '{}' AND code = '{}' AND used = 0 "
        "AND expires_at > FROM_UNIXTIME({}) AND created_at >= FROM_UNIXTIME({})",
        lease->Escape(student_id), lease->Escape(code), now, created_after));
}

labgate::common::StatusOr<labgate::core::AuthCodeRecord> MySqlAuthCodeRepository::FindLatest(const std::string& student_id
                                                                                            , const std::string& code
                                                                                            , std::int64_t created_after) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    return FindOne(*lease, fmt::format(
        "WHERE student_id = '{}' AND code = '{}' AND created_at >= FROM_UNIXTIME({})",
        lease->Escape(student_id), lease->Escape(code), created_after));
}

labgate::common::StatusOr<bool> MySqlAuthCodeRepository::MarkUsedIfUnused(const std::string& id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format(
        "UPDATE auth_codes SET used = 1 WHERE id = '{}' AND used = 0", lease->Escape(id)));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::StatusOr<bool>(affected.Value() == 1);
}

labgate::common::Status MySqlAuthCodeRepository::Delete(const std::string& id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format("DELETE FROM auth_codes WHERE id = '{}'", lease->Escape(id)));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<std::size_t> MySqlAuthCodeRepository::DeleteCreatedBefore(std::int64_t cutoff) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto affected = lease->Execute(fmt::format(
        "DELETE FROM auth_codes WHERE created_at < FROM_UNIXTIME({})", cutoff));
    if (!affected.IsOk()) {
        return affected.GetStatus();
    }
    return labgate::common::StatusOr<std::size_t>(static_cast<std::size_t>(affected.Value()));
}

} // namespace storage
} // namespace labgate
