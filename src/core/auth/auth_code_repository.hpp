#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

namespace labgate {
namespace core {

// 一次性验证码记录
struct AuthCodeRecord {
    std::string id;
    std::string student_id;
    std::string code;
    std::int64_t created_at = 0;
    std::int64_t expires_at = 0;
    bool used = false;
};

// 验证码存储接口, 只暴露认证流程需要的原语
class AuthCodeRepository {
public:
    virtual ~AuthCodeRepository() = default;

    // 原子操作: 删除该学生所有未使用的验证码, 再插入新验证码
    virtual labgate::common::Status ReplaceActiveCode(const AuthCodeRecord& record) = 0;

    // 查找最近一条可用验证码: 未使用, expires_at > now, created_at >= created_after
    virtual labgate::common::StatusOr<AuthCodeRecord> FindUsable(const std::string& student_id
                                                                 , const std::string& code
                                                                 , std::int64_t now
                                                                 , std::int64_t created_after) const = 0;

    // 查找最近一条匹配的验证码 (不论是否使用或过期)
    virtual labgate::common::StatusOr<AuthCodeRecord> FindLatest(const std::string& student_id
                                                                 , const std::string& code
                                                                 , std::int64_t created_after) const = 0;

    // 条件更新: 仅当仍未使用时标记为已使用; 返回值表示本次调用是否完成了标记
    virtual labgate::common::StatusOr<bool> MarkUsedIfUnused(const std::string& id) = 0;

    virtual labgate::common::Status Delete(const std::string& id) = 0;

    // 范围删除: created_at < cutoff 的全部验证码
    virtual labgate::common::StatusOr<std::size_t> DeleteCreatedBefore(std::int64_t cutoff) = 0;
};

// 基于内存的验证码存储实现
class InMemoryAuthCodeRepository : public AuthCodeRepository {
public:
    labgate::common::Status ReplaceActiveCode(const AuthCodeRecord& record) override;
    labgate::common::StatusOr<AuthCodeRecord> FindUsable(const std::string& student_id
                                                         , const std::string& code
                                                         , std::int64_t now
                                                         , std::int64_t created_after) const override;
    labgate::common::StatusOr<AuthCodeRecord> FindLatest(const std::string& student_id
                                                         , const std::string& code
                                                         , std::int64_t created_after) const override;
    labgate::common::StatusOr<bool> MarkUsedIfUnused(const std::string& id) override;
    labgate::common::Status Delete(const std::string& id) override;
    labgate::common::StatusOr<std::size_t> DeleteCreatedBefore(std::int64_t cutoff) override;

    // 当前保存的全部记录快照
    std::vector<AuthCodeRecord> Snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<AuthCodeRecord> codes_; // 按插入顺序保存
};

} // namespace core
} // namespace labgate
