#include "storage/mysql/transaction.hpp"

namespace labgate {
namespace storage {

Transaction::Transaction(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Transaction::~Transaction() {
    if (active_) {
        Rollback();
    }
}

labgate::common::Status Transaction::Begin() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    lease_ = std::move(lease_or.Value());
    if (mysql_autocommit(lease_.Raw(), 0) != 0) {
        return MapMySqlError(lease_.Raw(), "begin transaction failed");
    }
    active_ = true;
    return labgate::common::Status::OK();
}

labgate::common::Status Transaction::Commit() {
    if (!active_) {
        return labgate::common::Status::OK();
    }
    if (mysql_commit(lease_.Raw()) != 0) {
        auto status = MapMySqlError(lease_.Raw(), "commit failed");
        Rollback();
        return status;
    }
    mysql_autocommit(lease_.Raw(), 1);
    active_ = false;
    return labgate::common::Status::OK();
}

labgate::common::Status Transaction::Rollback() {
    if (!active_) {
        return labgate::common::Status::OK();
    }
    active_ = false;
    if (mysql_rollback(lease_.Raw()) != 0) {
        auto status = MapMySqlError(lease_.Raw(), "rollback failed");
        mysql_autocommit(lease_.Raw(), 1);
        return status;
    }
    // 恢复自动提交, 连接归还后供普通语句使用
    mysql_autocommit(lease_.Raw(), 1);
    return labgate::common::Status::OK();
}

}
}
