#include "storage/mysql/connection_pool.hpp"

namespace labgate {
namespace storage {

ConnectionPool::ConnectionPool(Options options): options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_));
    }
    pool_ = nullptr;
}

labgate::common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_ptr<Connection> connection;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            connection = std::move(idle_.front());
            idle_.pop();
        } else if (total_connections_ < options_.pool_size) {
            // 先占位再在锁外建连, 失败时归还名额
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            connection = std::move(created.Value());
        } else {
            if (!cv_.wait_for(lock, options_.acquire_timeout, [this]() { return !idle_.empty(); })) {
                return labgate::common::Status::Unavailable("Acquire connection timeout");
            }
            connection = std::move(idle_.front());
            idle_.pop();
        }
    }
    return labgate::common::StatusOr<Lease>(Lease(this, std::move(connection)));
}

labgate::common::Status ConnectionPool::Warmup() {
    auto lease = Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    if (mysql_ping(lease.Value().Raw()) != 0) {
        return MapMySqlError(lease.Value().Raw(), "mysql_ping failed");
    }
    return labgate::common::Status::OK();
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection) {
    // 断开的连接直接丢弃
    if (mysql_ping(connection->Raw()) != 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        --total_connections_;
        cv_.notify_one();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push(std::move(connection));
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace labgate
