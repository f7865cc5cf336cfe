#pragma once

#include "common/status_or.hpp"

#include <string>

namespace labgate {
namespace core {

// 设备指纹: SHA-256(user_agent + ":" + 随机 UUID), 64 位小写十六进制
labgate::common::StatusOr<std::string> GenerateFingerprint(const std::string& user_agent);

} // namespace core
} // namespace labgate
