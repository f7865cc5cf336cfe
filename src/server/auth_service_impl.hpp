#pragma once

// 项目头文件
#include "common/config.hpp"
#include "common/logger.hpp"
#include "core/auth/auth_manager.hpp"
#include "server/cookies.hpp"

// gRPC 生成的头文件
#include "auth_service.grpc.pb.h"

// 第三方库
#include <grpcpp/grpcpp.h>

// C++ 标准库
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace labgate {
namespace server {

struct AuthServiceOptions {
    CookieOptions cookies;
    std::string cleanup_api_key;  // 为空时 RunCleanup 不校验
    bool lazy_cleanup = true;     // 登录成功后在后台触发节流清理
};

class AuthServiceImpl final : public proto::auth::AuthService::Service {
public:
    // 按配置组装 MySQL/Redis/sendmail 后端, 不可用时退回内存实现
    explicit AuthServiceImpl(const labgate::common::AppConfig& config);
    AuthServiceImpl(std::shared_ptr<labgate::core::AuthManager> manager, AuthServiceOptions options);
    ~AuthServiceImpl();

    grpc::Status RequestCode(grpc::ServerContext* context
                             , const proto::auth::RequestCodeRequest* request
                             , proto::auth::RequestCodeResponse* response) override;

    grpc::Status VerifyCode(grpc::ServerContext* context
                            , const proto::auth::VerifyCodeRequest* request
                            , proto::auth::VerifyCodeResponse* response) override;

    grpc::Status GetStatus(grpc::ServerContext* context
                           , const proto::auth::GetStatusRequest* request
                           , proto::auth::GetStatusResponse* response) override;

    grpc::Status Logout(grpc::ServerContext* context
                        , const proto::auth::LogoutRequest* request
                        , proto::auth::LogoutResponse* response) override;

    grpc::Status RunCleanup(grpc::ServerContext* context
                            , const proto::auth::RunCleanupRequest* request
                            , proto::auth::RunCleanupResponse* response) override;

    // 等待后台清理结束
    void WaitForBackgroundCleanup();

private:
    // 辅助函数: 转换状态码
    static grpc::Status ToGrpcStatus(const labgate::common::Status& status);
    static void FillStudentInfo(const labgate::core::IdentityRecord& identity, proto::common::StudentInfo* info);
    void ClearCredentials(grpc::ServerContext* context) const;
    void TriggerLazyCleanup();

    std::shared_ptr<labgate::core::AuthManager> manager_;
    AuthServiceOptions options_;
    std::mutex cleanup_mutex_;
    std::future<void> cleanup_future_; // 同一时间最多一个后台清理
};

// 读取请求元数据中的全部同名值
std::vector<std::string> MetadataValues(const grpc::ServerContext* context, const std::string& key);

} // namespace server
} // namespace labgate
