#pragma once

#include "common/status_or.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace labgate {
namespace common {

// 基于 OpenSSL RAND_bytes 的安全随机工具

// 生成 length 字节随机数据并转为小写十六进制
StatusOr<std::string> RandomHex(std::size_t length);

// 生成 RFC 4122 version 4 UUID 字符串
StatusOr<std::string> RandomUuid();

// 在 [0, bound) 内均匀取值 (拒绝采样, 无取模偏差)
StatusOr<std::uint32_t> RandomBelow(std::uint32_t bound);

// SHA-256 摘要, 输出 64 位小写十六进制
StatusOr<std::string> Sha256Hex(const std::string& data);

std::string BytesToHex(const unsigned char* data, std::size_t len);

}
}
