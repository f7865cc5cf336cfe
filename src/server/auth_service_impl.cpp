// 主服务头文件
#include "server/auth_service_impl.hpp"
// 认证相关头文件
#include "core/auth/errors.hpp"
#include "delivery/sendmail_delivery.hpp"
// 储存库(mysql)相关头文件
#include "storage/mysql/auth_code_repository.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/identity_directory.hpp"
#include "storage/mysql/session_repository.hpp"
// 缓存(redis)相关头文件
#include "cache/redis_client.hpp"
#include "cache/redis_request_limiter.hpp"

#include <openssl/crypto.h>

#include <chrono>

namespace labgate {
namespace server {

namespace {

using labgate::common::StatusCode;

// 创建Redis客户端
std::shared_ptr<labgate::cache::RedisClient> CreateRedisClient(const labgate::common::RedisConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    auto client = std::make_shared<labgate::cache::RedisClient>(config);
    auto status = client->Connect();
    if (!status.IsOk()) {
        LABGATE_LOG_WARN("[AuthService] Redis init failed, fallback to in-memory limiter: {}", status.Message());
        return nullptr;
    }
    return client;
}

// 创建MySQL连接池, 不可用时返回空指针
std::shared_ptr<labgate::storage::ConnectionPool> CreateConnectionPool(const labgate::common::MysqlConfig& config) {
    if (!config.enabled) {
        LABGATE_LOG_WARN("[AuthService] MySQL backend disabled; using in-memory repositories");
        return nullptr;
    }
    auto pool = std::make_shared<labgate::storage::ConnectionPool>(labgate::storage::OptionsFromConfig(config));
    auto status = pool->Warmup();
    if (!status.IsOk()) {
        LABGATE_LOG_ERROR("[AuthService] Failed to initialize MySQL connection: {}", status.Message());
        return nullptr;
    }
    LABGATE_LOG_INFO("[AuthService] MySQL connection pool initialized successfully");
    return pool;
}

std::shared_ptr<labgate::core::AuthManager> CreateAuthManager(const labgate::common::AppConfig& config) {
    labgate::core::AuthOptions options;
    options.jwt_secret = config.auth.jwt_secret;
    options.token_ttl = std::chrono::seconds(config.auth.token_ttl_seconds);
    options.otp.code_ttl = std::chrono::seconds(config.auth.code_ttl_seconds);
    options.otp.lookback = std::chrono::seconds(config.auth.code_lookback_seconds);
    options.request_limit.max_requests = config.auth.request_limit.max_requests;
    options.request_limit.window = std::chrono::seconds(config.auth.request_limit.window_seconds);
    options.cleanup.interval = std::chrono::seconds(config.cleanup.interval_seconds);
    options.cleanup.code_retention = std::chrono::hours(config.cleanup.code_retention_hours);
    options.cleanup.revoked_grace = std::chrono::hours(config.cleanup.revoked_grace_hours);

    labgate::core::AuthDependencies deps;
    deps.clock = std::make_shared<labgate::common::SystemClock>();

    if (auto pool = CreateConnectionPool(config.storage.mysql)) {
        deps.identities = std::make_shared<labgate::storage::MySqlIdentityDirectory>(pool);
        deps.codes = std::make_shared<labgate::storage::MySqlAuthCodeRepository>(pool);
        deps.sessions = std::make_shared<labgate::storage::MySqlSessionRepository>(pool);
    }
    if (auto redis = CreateRedisClient(config.cache.redis)) {
        deps.limiter = std::make_shared<labgate::cache::RedisRequestLimiter>(redis, options.request_limit);
    }
    if (!config.delivery.sendmail_path.empty()) {
        deps.delivery = std::make_shared<labgate::delivery::SendmailCodeDelivery>(config.delivery);
    } else {
        LABGATE_LOG_WARN("[AuthService] delivery.sendmail_path not set; RequestCode will fail");
    }
    return std::make_shared<labgate::core::AuthManager>(std::move(deps), std::move(options));
}

AuthServiceOptions ServiceOptionsFromConfig(const labgate::common::AppConfig& config) {
    AuthServiceOptions options;
    options.cookies.secure = config.auth.secure_cookies;
    options.cookies.max_age_seconds = config.auth.token_ttl_seconds;
    options.cleanup_api_key = config.cleanup.api_key;
    return options;
}

// 按状态码选择对外错误码
labgate::core::AuthErrorCode AuthErrorFor(const labgate::common::Status& status, bool verifying_code) {
    using labgate::core::AuthErrorCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return AuthErrorCode::kOk;
        case StatusCode::kInvalidArgument:
            return AuthErrorCode::kMalformedInput;
        case StatusCode::kNotFound:
            return AuthErrorCode::kEmailNotFound;
        case StatusCode::kUnauthenticated:
        case StatusCode::kPermissionDenied:
            return verifying_code ? AuthErrorCode::kInvalidCode : AuthErrorCode::kUnauthorized;
        case StatusCode::kResourceExhausted:
            return AuthErrorCode::kTooManyRequests;
        default:
            return AuthErrorCode::kServiceFailure;
    }
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

std::vector<std::string> MetadataValues(const grpc::ServerContext* context, const std::string& key) {
    std::vector<std::string> values;
    if (context == nullptr) {
        return values;
    }
    const auto& metadata = context->client_metadata();
    auto range = metadata.equal_range(grpc::string_ref(key));
    for (auto it = range.first; it != range.second; ++it) {
        values.emplace_back(it->second.data(), it->second.size());
    }
    return values;
}

AuthServiceImpl::AuthServiceImpl(const labgate::common::AppConfig& config)
    : AuthServiceImpl(CreateAuthManager(config), ServiceOptionsFromConfig(config)) {}

AuthServiceImpl::AuthServiceImpl(std::shared_ptr<labgate::core::AuthManager> manager, AuthServiceOptions options)
    : manager_(std::move(manager)), options_(std::move(options)) {}

AuthServiceImpl::~AuthServiceImpl() {
    WaitForBackgroundCleanup();
}

grpc::Status AuthServiceImpl::RequestCode(grpc::ServerContext* context
                                          , const proto::auth::RequestCodeRequest* request
                                          , proto::auth::RequestCodeResponse* response) {
    std::int64_t retry_after = 0;
    auto status = manager_->RequestCode(request->email(), &retry_after);
    labgate::core::ErrorToProto(AuthErrorFor(status, false), status, response->mutable_error());
    if (!status.IsOk()) {
        if (status.Code() == StatusCode::kResourceExhausted) {
            response->set_retry_after_seconds(retry_after);
            // 非 OK 状态不携带响应体, 重试时间同时放入 trailer
            if (context != nullptr) {
                context->AddTrailingMetadata("retry-after", std::to_string(retry_after));
            }
        }
        return ToGrpcStatus(status);
    }
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::VerifyCode(grpc::ServerContext* context
                                         , const proto::auth::VerifyCodeRequest* request
                                         , proto::auth::VerifyCodeResponse* response) {
    auto agents = MetadataValues(context, "user-agent");
    const std::string user_agent = agents.empty() ? "" : agents.front();

    auto login = manager_->VerifyCode(request->email(), request->code(), user_agent);
    if (!login.IsOk()) {
        const auto& status = login.GetStatus();
        labgate::core::ErrorToProto(AuthErrorFor(status, true), status, response->mutable_error());
        return ToGrpcStatus(status);
    }

    const auto& result = login.Value();
    if (context != nullptr) {
        for (const auto& cookie : CredentialCookies(result.access_token, result.fingerprint, options_.cookies)) {
            context->AddInitialMetadata("set-cookie", cookie);
        }
    }
    FillStudentInfo(result.identity, response->mutable_student());
    labgate::core::ErrorToProto(labgate::core::AuthErrorCode::kOk, labgate::common::Status::OK()
                                , response->mutable_error());
    TriggerLazyCleanup();
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::GetStatus(grpc::ServerContext* context
                                        , const proto::auth::GetStatusRequest*
                                        , proto::auth::GetStatusResponse* response) {
    auto credentials = CredentialsFromCookies(MetadataValues(context, "cookie"));
    auto status = manager_->GetStatus(credentials);
    response->set_authenticated(status.authenticated);
    if (status.authenticated) {
        FillStudentInfo(status.identity, response->mutable_student());
    } else {
        ClearCredentials(context);
    }
    labgate::core::ErrorToProto(labgate::core::AuthErrorCode::kOk, labgate::common::Status::OK()
                                , response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::Logout(grpc::ServerContext* context
                                     , const proto::auth::LogoutRequest* request
                                     , proto::auth::LogoutResponse* response) {
    auto credentials = CredentialsFromCookies(MetadataValues(context, "cookie"));
    manager_->Logout(credentials, request->all_devices());
    ClearCredentials(context);
    labgate::core::ErrorToProto(labgate::core::AuthErrorCode::kOk, labgate::common::Status::OK()
                                , response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::RunCleanup(grpc::ServerContext* context
                                         , const proto::auth::RunCleanupRequest*
                                         , proto::auth::RunCleanupResponse* response) {
    if (!options_.cleanup_api_key.empty()) {
        auto keys = MetadataValues(context, "x-api-key");
        if (keys.empty() || !ConstantTimeEquals(keys.front(), options_.cleanup_api_key)) {
            LABGATE_LOG_WARN("[AuthService] RunCleanup rejected: missing or wrong api key");
            auto status = labgate::core::FromAuthError(labgate::core::AuthErrorCode::kUnauthorized);
            labgate::core::ErrorToProto(labgate::core::AuthErrorCode::kUnauthorized, status, response->mutable_error());
            return ToGrpcStatus(status);
        }
    }

    auto report = manager_->RunCleanup();
    if (!report.IsOk()) {
        const auto& status = report.GetStatus();
        labgate::core::ErrorToProto(AuthErrorFor(status, false), status, response->mutable_error());
        return ToGrpcStatus(status);
    }
    response->set_sessions_deleted(static_cast<std::int64_t>(report.Value().sessions_deleted));
    response->set_codes_deleted(static_cast<std::int64_t>(report.Value().codes_deleted));
    response->set_timestamp(manager_->Scheduler()->LastRunSeconds());
    labgate::core::ErrorToProto(labgate::core::AuthErrorCode::kOk, labgate::common::Status::OK()
                                , response->mutable_error());
    return grpc::Status::OK;
}

void AuthServiceImpl::WaitForBackgroundCleanup() {
    std::lock_guard<std::mutex> lock(cleanup_mutex_);
    if (cleanup_future_.valid()) {
        cleanup_future_.wait();
    }
}

void AuthServiceImpl::TriggerLazyCleanup() {
    if (!options_.lazy_cleanup) {
        return;
    }
    std::lock_guard<std::mutex> lock(cleanup_mutex_);
    // 上一次后台清理尚未结束时不再启动新的
    if (cleanup_future_.valid()
        && cleanup_future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }
    auto scheduler = manager_->Scheduler();
    cleanup_future_ = std::async(std::launch::async, [scheduler]() {
        scheduler->RunLazy();
    });
}

void AuthServiceImpl::ClearCredentials(grpc::ServerContext* context) const {
    if (context == nullptr) {
        return;
    }
    for (const auto& cookie : ClearedCredentialCookies(options_.cookies)) {
        context->AddInitialMetadata("set-cookie", cookie);
    }
}

void AuthServiceImpl::FillStudentInfo(const labgate::core::IdentityRecord& identity
                                      , proto::common::StudentInfo* info) {
    if (info == nullptr) {
        return;
    }
    info->set_student_id(identity.id);
    info->set_name(identity.name);
    info->set_email(identity.email);
}

grpc::Status AuthServiceImpl::ToGrpcStatus(const labgate::common::Status& status) {
    switch (status.Code()) {
        case StatusCode::kOk:
            return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
            return {grpc::StatusCode::INVALID_ARGUMENT, status.Message()};
        case StatusCode::kNotFound:
            return {grpc::StatusCode::NOT_FOUND, status.Message()};
        case StatusCode::kAlreadyExists:
            return {grpc::StatusCode::ALREADY_EXISTS, status.Message()};
        case StatusCode::kPermissionDenied:
            return {grpc::StatusCode::PERMISSION_DENIED, status.Message()};
        case StatusCode::kResourceExhausted:
            return {grpc::StatusCode::RESOURCE_EXHAUSTED, status.Message()};
        case StatusCode::kUnauthenticated:
            return {grpc::StatusCode::UNAUTHENTICATED, status.Message()};
        case StatusCode::kInternal:
            return {grpc::StatusCode::INTERNAL, status.Message()};
        case StatusCode::kUnavailable:
            return {grpc::StatusCode::UNAVAILABLE, status.Message()};
    }
    return {grpc::StatusCode::UNKNOWN, status.Message()};
}

} // namespace server
} // namespace labgate
