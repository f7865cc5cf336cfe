#include "storage/mysql/connection.hpp"

#include <mysql/errmsg.h>

#include <vector>

namespace labgate {
namespace storage {

labgate::common::Status MapMySqlError(MYSQL* handle, const std::string& context) {
    std::string message = context;
    if (handle == nullptr) {
        return labgate::common::Status::Internal(message);
    }
    message += ": ";
    message += mysql_error(handle);
    switch (mysql_errno(handle)) {
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
            return labgate::common::Status::Unavailable(message);
        default:
            return labgate::common::Status::Internal(message);
    }
}

Connection::Connection(MYSQL* handle, Options options): handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

// 创建并初始化 MySQL 连接
labgate::common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return MapMySqlError(nullptr, "mysql_init failed");
    }

    // 超时以秒为单位, 最少 1 秒
    auto to_seconds = [](std::chrono::milliseconds ms) {
        auto sec = static_cast<unsigned int>(ms.count() / 1000);
        return sec == 0 ? 1u : sec;
    };
    unsigned int connect_timeout_sec = to_seconds(options.connect_timeout);
    unsigned int read_timeout_sec = to_seconds(options.read_timeout);
    unsigned int write_timeout_sec = to_seconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_sec);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout_sec);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout_sec);

    if (!mysql_real_connect(handle,
                           options.host.c_str(),
                           options.user.c_str(),
                           options.password.c_str(),
                           options.database.c_str(),
                           options.port,
                           nullptr,
                           0)) {
        auto status = labgate::common::Status::Unavailable(
            std::string("mysql_real_connect failed: ") + mysql_error(handle));
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty()) {
        mysql_set_character_set(handle, options.charset.c_str());
    }
    // 时间列统一按 UTC 解释
    const char* kSetTimeZone = "SET time_zone = '+00:00'";
    if (mysql_query(handle, kSetTimeZone) != 0) {
        auto status = MapMySqlError(handle, "set time_zone failed");
        mysql_close(handle);
        return status;
    }

    return labgate::common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

std::string Connection::Escape(const std::string& value) const {
    std::vector<char> buffer(value.size() * 2 + 1);
    auto len = mysql_real_escape_string(handle_, buffer.data(), value.data(), value.size());
    return std::string(buffer.data(), len);
}

labgate::common::StatusOr<std::uint64_t> Connection::Execute(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(handle_, "query failed");
    }
    auto affected = static_cast<std::uint64_t>(mysql_affected_rows(handle_));
    if (affected == ~static_cast<std::uint64_t>(0)) {
        affected = 0;
    }
    return labgate::common::StatusOr<std::uint64_t>(affected);
}

labgate::common::StatusOr<ResultPtr> Connection::Query(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(handle_, "query failed");
    }
    MYSQL_RES* res = mysql_store_result(handle_);
    if (res == nullptr) {
        return MapMySqlError(handle_, "store result failed");
    }
    return labgate::common::StatusOr<ResultPtr>(ResultPtr(res));
}

} // namespace storage
} // namespace labgate
