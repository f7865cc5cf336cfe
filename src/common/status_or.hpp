#pragma once

#include "common/status.hpp"

#include <type_traits>
#include <utility>

namespace labgate {
namespace common {

// 返回一个包含状态或值的对象
template <typename T>
class StatusOr {
public:
    StatusOr(const Status& status) : status_(status) {}
    StatusOr(Status&& status) : status_(std::move(status)) {}

    template <class U = T, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    explicit StatusOr(U&& value)
        : status_(Status::OK()), value_(std::forward<U>(value)) {}

    bool IsOk() const {
        return status_.IsOk();
    }
    const Status& GetStatus() const {
        return status_;
    }
    StatusCode Code() const {
        return status_.Code();
    }

    // 目标不存在, 调用方通常映射为 "未找到" 而不是故障
    bool IsNotFound() const {
        return status_.Code() == StatusCode::kNotFound;
    }
    // 外部协作方失败(数据库、缓存、投递), 需要上报为 5xx
    bool IsCollaboratorFailure() const {
        return ::labgate::common::IsCollaboratorFailure(status_);
    }

    // 访问存储的值
    T& Value() & {
        return value_;
    }
    T&& Value() && {
        return std::move(value_);
    }
    const T& Value() const& {
        return value_;
    }
    const T&& Value() const&& = delete;

    // 失败时返回 fallback, 用于尽力而为的读取
    T ValueOr(T fallback) const& {
        return status_.IsOk() ? value_ : std::move(fallback);
    }
    T ValueOr(T fallback) && {
        return status_.IsOk() ? std::move(value_) : std::move(fallback);
    }

private:
    Status status_;
    T value_{};
};

} // namespace common
} // namespace labgate
