#pragma once

#include "common/status.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace labgate {
namespace storage {

// 事务作用域: 未提交即析构时自动回滚
class Transaction {
public:
    explicit Transaction(std::shared_ptr<ConnectionPool> pool);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    labgate::common::Status Begin();
    labgate::common::Status Commit();
    labgate::common::Status Rollback();

    // 仅在 Begin 成功后有效
    Connection& Conn() noexcept { return *lease_; }
private:
    std::shared_ptr<ConnectionPool> pool_;
    ConnectionPool::Lease lease_;
    bool active_ = false;
};

}
}
