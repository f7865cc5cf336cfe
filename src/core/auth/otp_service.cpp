#include "core/auth/otp_service.hpp"

#include "common/crypto.hpp"
#include "common/logger.hpp"
#include "core/auth/errors.hpp"

#include <fmt/format.h>

namespace labgate {
namespace core {

namespace {

constexpr std::size_t kCodeLength = 6;
constexpr std::uint32_t kCodeMin = 100000;
constexpr std::uint32_t kCodeSpan = 900000; // 100000 - 999999

const char* MissReasonName(OtpMissReason reason) {
    switch (reason) {
        case OtpMissReason::kExpired:
            return "expired";
        case OtpMissReason::kConsumed:
            return "already used";
        case OtpMissReason::kNeverIssued:
            return "not found";
    }
    return "not found";
}

} // namespace

OtpService::OtpService(std::shared_ptr<AuthCodeRepository> repository
                       , std::shared_ptr<const labgate::common::Clock> clock
                       , OtpOptions options)
    : repository_(std::move(repository)), clock_(std::move(clock)), options_(options) {
    if (!repository_) {
        repository_ = std::make_shared<InMemoryAuthCodeRepository>();
    }
    if (!clock_) {
        clock_ = std::make_shared<labgate::common::SystemClock>();
    }
}

bool OtpService::IsWellFormedCode(const std::string& code) {
    if (code.size() != kCodeLength) {
        return false;
    }
    for (char c : code) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

OtpService::StatusOrCode OtpService::Issue(const std::string& student_id) {
    if (student_id.empty()) {
        return Status::InvalidArgument("student id is required");
    }
    auto offset_or = labgate::common::RandomBelow(kCodeSpan);
    if (!offset_or.IsOk()) {
        return offset_or.GetStatus();
    }
    auto id_or = labgate::common::RandomUuid();
    if (!id_or.IsOk()) {
        return id_or.GetStatus();
    }

    const auto now = clock_->NowSeconds();
    AuthCodeRecord record;
    record.id = std::move(id_or.Value());
    record.student_id = student_id;
    record.code = fmt::format("{:06d}", kCodeMin + offset_or.Value());
    record.created_at = now;
    record.expires_at = now + options_.code_ttl.count();
    record.used = false;

    auto status = repository_->ReplaceActiveCode(record);
    if (!status.IsOk()) {
        LABGATE_LOG_ERROR("Failed to store auth code for student {}: {}", student_id, status.Message());
        return status;
    }
    LABGATE_LOG_INFO("Auth code issued for student {}", student_id);
    return StatusOrCode(std::move(record.code));
}

OtpService::StatusOrCode OtpService::Verify(const std::string& student_id, const std::string& code) {
    if (student_id.empty() || !IsWellFormedCode(code)) {
        return FromAuthError(AuthErrorCode::kMalformedInput, "Invalid code format");
    }

    const auto now = clock_->NowSeconds();
    const auto created_after = now - options_.lookback.count();

    auto found = repository_->FindUsable(student_id, code, now, created_after);
    if (!found.IsOk()) {
        if (!found.IsNotFound()) {
            return found.GetStatus();
        }
        auto reason = ClassifyMiss(student_id, code, now, created_after);
        LABGATE_LOG_INFO("Auth code rejected for student {}: {}", student_id, MissReasonName(reason));
        return FromAuthError(AuthErrorCode::kInvalidCode);
    }

    // 并发核销时只有一个调用能完成条件更新
    auto marked = repository_->MarkUsedIfUnused(found.Value().id);
    if (!marked.IsOk()) {
        return marked.GetStatus();
    }
    if (!marked.Value()) {
        LABGATE_LOG_INFO("Auth code for student {} was consumed concurrently", student_id);
        return FromAuthError(AuthErrorCode::kInvalidCode);
    }
    return StatusOrCode(student_id);
}

OtpMissReason OtpService::ClassifyMiss(const std::string& student_id, const std::string& code
                                       , std::int64_t now, std::int64_t created_after) {
    auto latest = repository_->FindLatest(student_id, code, created_after);
    if (!latest.IsOk()) {
        return OtpMissReason::kNeverIssued;
    }
    const auto& rec = latest.Value();
    if (rec.used) {
        return OtpMissReason::kConsumed;
    }
    if (rec.expires_at <= now) {
        // 过期验证码顺手删除
        auto status = repository_->Delete(rec.id);
        if (!status.IsOk()) {
            LABGATE_LOG_WARN("Failed to delete expired auth code: {}", status.Message());
        }
        return OtpMissReason::kExpired;
    }
    return OtpMissReason::kNeverIssued;
}

} // namespace core
} // namespace labgate
