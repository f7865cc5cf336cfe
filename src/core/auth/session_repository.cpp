#include "core/auth/session_repository.hpp"

#include <mutex>

namespace labgate {
namespace core {

labgate::common::Status InMemorySessionRepository::Insert(const SessionRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sessions_.count(record.id) != 0) {
        return labgate::common::Status::AlreadyExists("Session already exists");
    }
    sessions_[record.id] = record;
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<SessionRecord> InMemorySessionRepository::FindActive(const std::string& id
                                                                               , const std::string& fingerprint) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second.revoked || it->second.fingerprint != fingerprint) {
        return labgate::common::Status::NotFound("Session not found");
    }
    return labgate::common::StatusOr<SessionRecord>(it->second);
}

labgate::common::StatusOr<bool> InMemorySessionRepository::RevokeIfFingerprintMismatch(const std::string& id
                                                                                       , const std::string& fingerprint) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second.revoked || it->second.fingerprint == fingerprint) {
        return labgate::common::StatusOr<bool>(false);
    }
    it->second.revoked = true;
    return labgate::common::StatusOr<bool>(true);
}

labgate::common::Status InMemorySessionRepository::TouchLastSeen(const std::string& id, std::int64_t now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return labgate::common::Status::NotFound("Session not found");
    }
    it->second.last_seen = now;
    return labgate::common::Status::OK();
}

labgate::common::Status InMemorySessionRepository::Revoke(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        it->second.revoked = true;
    }
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<std::size_t> InMemorySessionRepository::RevokeAllForStudent(const std::string& student_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t count = 0;
    for (auto& entry : sessions_) {
        if (entry.second.student_id == student_id && !entry.second.revoked) {
            entry.second.revoked = true;
            ++count;
        }
    }
    return labgate::common::StatusOr<std::size_t>(count);
}

labgate::common::StatusOr<std::size_t> InMemorySessionRepository::DeleteExpired(std::int64_t revoked_before
                                                                                , std::int64_t active_before) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t count = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& rec = it->second;
        bool expired = rec.revoked ? rec.created_at < revoked_before : rec.created_at < active_before;
        if (expired) {
            it = sessions_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return labgate::common::StatusOr<std::size_t>(count);
}

labgate::common::StatusOr<SessionRecord> InMemorySessionRepository::Find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return labgate::common::Status::NotFound("Session not found");
    }
    return labgate::common::StatusOr<SessionRecord>(it->second);
}

std::size_t InMemorySessionRepository::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace core
} // namespace labgate
