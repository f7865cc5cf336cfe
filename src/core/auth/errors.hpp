#pragma once

#include "common.pb.h"
#include "common/status.hpp"

#include <string>

namespace labgate {
namespace core {

// 对调用方可见的认证错误码, 不区分内部失败原因
enum class AuthErrorCode {
    kOk = 0,
    kMalformedInput = 1,
    kEmailNotFound = 2,
    kInvalidCode = 3,
    kUnauthorized = 4,
    kTooManyRequests = 5,
    kServiceFailure = 6,
};

// 对外统一的错误文案
inline const char* AuthErrorMessage(AuthErrorCode error) {
    switch (error) {
        case AuthErrorCode::kOk:
            return "";
        case AuthErrorCode::kMalformedInput:
            return "Email and code are required";
        case AuthErrorCode::kEmailNotFound:
            return "Email not found";
        case AuthErrorCode::kInvalidCode:
            return "Invalid code";
        case AuthErrorCode::kUnauthorized:
            return "Unauthorized";
        case AuthErrorCode::kTooManyRequests:
            return "Too many requests";
        case AuthErrorCode::kServiceFailure:
            return "An error occurred";
    }
    return "An error occurred";
}

// 将 AuthErrorCode 转换为通用 Status
inline ::labgate::common::Status FromAuthError(AuthErrorCode error, std::string message = "") {
    using ::labgate::common::Status;
    if (message.empty()) {
        message = AuthErrorMessage(error);
    }
    switch (error) {
        case AuthErrorCode::kOk:
            return Status::OK();
        case AuthErrorCode::kMalformedInput:
            return Status::InvalidArgument(message);
        case AuthErrorCode::kEmailNotFound:
            return Status::NotFound(message);
        case AuthErrorCode::kInvalidCode:
        case AuthErrorCode::kUnauthorized:
            return Status::Unauthenticated(message);
        case AuthErrorCode::kTooManyRequests:
            return Status::ResourceExhausted(message);
        case AuthErrorCode::kServiceFailure:
            return Status::Internal(message);
    }
    return Status::Internal("Unknown auth error");
}

// 将错误信息填充到 protobuf Error 消息中
inline void ErrorToProto(AuthErrorCode error, const ::labgate::common::Status& status
                        , ::proto::common::Error* error_proto) {
    if (!error_proto) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(error));
    error_proto->set_message(status.Message());
}

}
}
