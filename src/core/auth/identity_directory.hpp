#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace labgate {
namespace core {

// 外部学生身份 (只读)
struct IdentityRecord {
    std::string id;
    std::string name;
    std::string email;
};

class IdentityDirectory {
public:
    virtual ~IdentityDirectory() = default;

    // 邮箱不区分大小写
    virtual labgate::common::StatusOr<IdentityRecord> FindByEmail(const std::string& email) const = 0;
    virtual labgate::common::StatusOr<IdentityRecord> FindById(const std::string& id) const = 0;
};

class InMemoryIdentityDirectory : public IdentityDirectory {
public:
    labgate::common::Status Add(const IdentityRecord& record);

    labgate::common::StatusOr<IdentityRecord> FindByEmail(const std::string& email) const override;
    labgate::common::StatusOr<IdentityRecord> FindById(const std::string& id) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, IdentityRecord> by_id_;
    std::unordered_map<std::string, std::string> id_by_email_; // 小写邮箱 -> id
};

// 邮箱规范化: 去除首尾空白并转小写
std::string NormalizeEmail(const std::string& email);

} // namespace core
} // namespace labgate
