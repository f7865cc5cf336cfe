#pragma once

#include "core/auth/auth_code_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace labgate {
namespace storage {

class MySqlAuthCodeRepository : public labgate::core::AuthCodeRepository {
public:
    explicit MySqlAuthCodeRepository(std::shared_ptr<ConnectionPool> pool);

    // 事务内锁定学生行, 删除未使用验证码后插入新验证码
    labgate::common::Status ReplaceActiveCode(const labgate::core::AuthCodeRecord& record) override;
    labgate::common::StatusOr<labgate::core::AuthCodeRecord> FindUsable(const std::string& student_id
                                                                        , const std::string& code
                                                                        , std::int64_t now
                                                                        , std::int64_t created_after) const override;
    labgate::common::StatusOr<labgate::core::AuthCodeRecord> FindLatest(const std::string& student_id
                                                                        , const std::string& code
                                                                        , std::int64_t created_after) const override;
    labgate::common::StatusOr<bool> MarkUsedIfUnused(const std::string& id) override;
    labgate::common::Status Delete(const std::string& id) override;
    labgate::common::StatusOr<std::size_t> DeleteCreatedBefore(std::int64_t cutoff) override;

private:
    labgate::common::StatusOr<labgate::core::AuthCodeRecord> FindOne(Connection& conn, const std::string& where) const;

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace labgate
