#include "storage/mysql/identity_directory.hpp"

#include <fmt/format.h>

namespace labgate {
namespace storage {

MySqlIdentityDirectory::MySqlIdentityDirectory(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

labgate::common::StatusOr<labgate::core::IdentityRecord> MySqlIdentityDirectory::FindOne(Connection& conn
                                                                                      , const std::string& where) const {
    auto res = conn.Query("SELECT id, name, email FROM students " + where + " LIMIT 1");
    if (!res.IsOk()) {
        return res.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res.Value().get());
    if (!row || !row[0]) {
        return labgate::common::Status::NotFound("Identity not found");
    }
    labgate::core::IdentityRecord rec;
    rec.id = row[0];
    rec.name = row[1] ? row[1] : "";
    rec.email = row[2] ? row[2] : "";
    return labgate::common::StatusOr<labgate::core::IdentityRecord>(std::move(rec));
}

labgate::common::StatusOr<labgate::core::IdentityRecord> MySqlIdentityDirectory::FindByEmail(const std::string& email) const {
    auto normalized = labgate::core::NormalizeEmail(email);
    if (normalized.empty()) {
        return labgate::common::Status::NotFound("Identity not found");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    return FindOne(*lease, fmt::format("WHERE LOWER(email) = '{}'", lease->Escape(normalized)));
}

labgate::common::StatusOr<labgate::core::IdentityRecord> MySqlIdentityDirectory::FindById(const std::string& id) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    return FindOne(*lease, fmt::format("WHERE id = '{}'", lease->Escape(id)));
}

} // namespace storage
} // namespace labgate
