#include "core/auth/identity_directory.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace labgate {
namespace core {

std::string NormalizeEmail(const std::string& email) {
    auto begin = email.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = email.find_last_not_of(" \t\r\n");
    std::string out = email.substr(begin, end - begin + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

labgate::common::Status InMemoryIdentityDirectory::Add(const IdentityRecord& record) {
    if (record.id.empty() || record.email.empty()) {
        return labgate::common::Status::InvalidArgument("Identity id and email are required");
    }
    auto key = NormalizeEmail(record.email);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (by_id_.count(record.id) != 0 || id_by_email_.count(key) != 0) {
        return labgate::common::Status::AlreadyExists("Identity already exists");
    }
    by_id_[record.id] = record;
    id_by_email_[key] = record.id;
    return labgate::common::Status::OK();
}

labgate::common::StatusOr<IdentityRecord> InMemoryIdentityDirectory::FindByEmail(const std::string& email) const {
    auto key = NormalizeEmail(email);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = id_by_email_.find(key);
    if (it == id_by_email_.end()) {
        return labgate::common::Status::NotFound("Identity not found");
    }
    return labgate::common::StatusOr<IdentityRecord>(by_id_.at(it->second));
}

labgate::common::StatusOr<IdentityRecord> InMemoryIdentityDirectory::FindById(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return labgate::common::Status::NotFound("Identity not found");
    }
    return labgate::common::StatusOr<IdentityRecord>(it->second);
}

} // namespace core
} // namespace labgate
