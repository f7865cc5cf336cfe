#include "core/auth/fingerprint.hpp"

#include "common/crypto.hpp"

namespace labgate {
namespace core {

labgate::common::StatusOr<std::string> GenerateFingerprint(const std::string& user_agent) {
    auto uuid_or = labgate::common::RandomUuid();
    if (!uuid_or.IsOk()) {
        return uuid_or.GetStatus();
    }
    return labgate::common::Sha256Hex(user_agent + ":" + uuid_or.Value());
}

} // namespace core
} // namespace labgate
