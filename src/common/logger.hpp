#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace labgate {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define LABGATE_LOG_DEBUG(...) ::labgate::common::GetLogger()->debug(__VA_ARGS__)
#define LABGATE_LOG_INFO(...)  ::labgate::common::GetLogger()->info(__VA_ARGS__)
#define LABGATE_LOG_WARN(...)  ::labgate::common::GetLogger()->warn(__VA_ARGS__)
#define LABGATE_LOG_ERROR(...) ::labgate::common::GetLogger()->error(__VA_ARGS__)

}
}
