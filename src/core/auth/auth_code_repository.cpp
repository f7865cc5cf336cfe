#include "core/auth/auth_code_repository.hpp"

#include <algorithm>
#include <mutex>

namespace labgate {
namespace core {

namespace {

// 在满足条件的记录中选出最新一条; created_at 相同时以后插入者为准
template <typename Pred>
const AuthCodeRecord* FindNewest(const std::vector<AuthCodeRecord>& codes, Pred pred) {
    const AuthCodeRecord* best = nullptr;
    for (const auto& rec : codes) {
        if (!pred(rec)) {
            continue;
        }
        if (best == nullptr || rec.created_at >= best->created_at) {
            best = &rec;
        }
    }
    return best;
}

} // namespace

labgate::common::Status InMemoryAuthCodeRepository::ReplaceActiveCode(const AuthCodeRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    codes_.erase(std::remove_if(codes_.begin(), codes_.end(),
                                [&record](const AuthCodeRecord& rec) {
                                    return rec.student_id == record.student_id && !rec.used;
                                }),
                 codes_.end());
    codes_.push_back(record);
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<AuthCodeRecord> InMemoryAuthCodeRepository::FindUsable(const std::string& student_id
                                                                                 , const std::string& code
                                                                                 , std::int64_t now
                                                                                 , std::int64_t created_after) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto* rec = FindNewest(codes_, [&](const AuthCodeRecord& r) {
        return r.student_id == student_id && r.code == code && !r.used
            && r.expires_at > now && r.created_at >= created_after;
    });
    if (rec == nullptr) {
        return labgate::common::Status::NotFound("Auth code not found");
    }
    return labgate::common::StatusOr<AuthCodeRecord>(*rec);
}

labgate::common::StatusOr<AuthCodeRecord> InMemoryAuthCodeRepository::FindLatest(const std::string& student_id
                                                                                 , const std::string& code
                                                                                 , std::int64_t created_after) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto* rec = FindNewest(codes_, [&](const AuthCodeRecord& r) {
        return r.student_id == student_id && r.code == code && r.created_at >= created_after;
    });
    if (rec == nullptr) {
        return labgate::common::Status::NotFound("Auth code not found");
    }
    return labgate::common::StatusOr<AuthCodeRecord>(*rec);
}

labgate::common::StatusOr<bool> InMemoryAuthCodeRepository::MarkUsedIfUnused(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& rec : codes_) {
        if (rec.id == id && !rec.used) {
            rec.used = true;
            return labgate::common::StatusOr<bool>(true);
        }
    }
    return labgate::common::StatusOr<bool>(false);
}

labgate::common::Status InMemoryAuthCodeRepository::Delete(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    codes_.erase(std::remove_if(codes_.begin(), codes_.end(),
                                [&id](const AuthCodeRecord& rec) { return rec.id == id; }),
                 codes_.end());
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<std::size_t> InMemoryAuthCodeRepository::DeleteCreatedBefore(std::int64_t cutoff) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto before = codes_.size();
    codes_.erase(std::remove_if(codes_.begin(), codes_.end(),
                                [cutoff](const AuthCodeRecord& rec) { return rec.created_at < cutoff; }),
                 codes_.end());
    return labgate::common::StatusOr<std::size_t>(before - codes_.size());
}

std::vector<AuthCodeRecord> InMemoryAuthCodeRepository::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return codes_;
}

} // namespace core
} // namespace labgate
