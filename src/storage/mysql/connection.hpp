#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>

#include <cstdint>
#include <memory>
#include <string>

namespace labgate {
namespace storage {

struct ResultDeleter {
    void operator()(MYSQL_RES* res) const noexcept {
        if (res != nullptr) {
            mysql_free_result(res);
        }
    }
};

// 查询结果集, 自动释放
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static labgate::common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    // 转义字符串字面量 (不含引号)
    std::string Escape(const std::string& value) const;

    // 执行写语句, 返回受影响行数
    labgate::common::StatusOr<std::uint64_t> Execute(const std::string& sql);

    // 执行查询; 无结果集时返回 Internal
    labgate::common::StatusOr<ResultPtr> Query(const std::string& sql);

    MYSQL* Raw() const noexcept {return handle_;}
    const Options& GetOptions() const noexcept {return options_;}
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

// 将 MySQL 错误码转换为 Status: 连接类错误为 Unavailable, 其余为 Internal
labgate::common::Status MapMySqlError(MYSQL* handle, const std::string& context);

}
}
