#pragma once

#include "core/auth/identity_directory.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace labgate {
namespace storage {

// 只读访问外部 students 表
class MySqlIdentityDirectory : public labgate::core::IdentityDirectory {
public:
    explicit MySqlIdentityDirectory(std::shared_ptr<ConnectionPool> pool);

    labgate::common::StatusOr<labgate::core::IdentityRecord> FindByEmail(const std::string& email) const override;
    labgate::common::StatusOr<labgate::core::IdentityRecord> FindById(const std::string& id) const override;

private:
    labgate::common::StatusOr<labgate::core::IdentityRecord> FindOne(Connection& conn, const std::string& where) const;

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace labgate
