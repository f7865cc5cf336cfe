#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace labgate {
namespace common {

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromEnvOrDefault();
    // 校验启动必需的配置项, 缺失时抛出 std::runtime_error
    static void Validate(const AppConfig& config);
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static nlohmann::json ReadFile(const std::string& path);
    static void ApplyEnvOverrides(AppConfig& config);
};

// 检测配置文件路径: 环境变量优先, 否则使用默认示例配置
std::string DetectConfigPath();

}
}
