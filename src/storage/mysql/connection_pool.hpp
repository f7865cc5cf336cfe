#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>

namespace labgate {
namespace storage {

// 有上限的连接池, 达到上限后等待归还直到 acquire_timeout
class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // RAII 租约: 析构时把连接还给池
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Connection* operator->() noexcept { return connection_.get(); }
        Connection& operator*() noexcept { return *connection_; }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }
    private:
        void Release();

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
    };

    labgate::common::StatusOr<Lease> Acquire();

    // 启动时确认数据库可达
    labgate::common::Status Warmup();

    const Options& GetOptions() const noexcept { return options_; }

private:
    void Return(std::unique_ptr<Connection> connection);

    Options options_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Connection>> idle_;
    std::size_t total_connections_ = 0;
};

} // namespace storage
} // namespace labgate
