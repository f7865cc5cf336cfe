#include "common/crypto.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <vector>

namespace labgate {
namespace common {

namespace {

Status FillRandom(unsigned char* buffer, std::size_t length) {
    if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
        return Status::Internal("RAND_bytes failed");
    }
    return Status::OK();
}

} // namespace

std::string BytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

StatusOr<std::string> RandomHex(std::size_t length) {
    std::vector<unsigned char> buffer(length);
    auto status = FillRandom(buffer.data(), buffer.size());
    if (!status.IsOk()) {
        return status;
    }
    return StatusOr<std::string>(BytesToHex(buffer.data(), buffer.size()));
}

StatusOr<std::string> RandomUuid() {
    std::array<unsigned char, 16> bytes{};
    auto status = FillRandom(bytes.data(), bytes.size());
    if (!status.IsOk()) {
        return status;
    }
    // version 4, variant 10xx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    const std::string hex = BytesToHex(bytes.data(), bytes.size());
    std::string uuid;
    uuid.reserve(36);
    uuid.append(hex, 0, 8).push_back('-');
    uuid.append(hex, 8, 4).push_back('-');
    uuid.append(hex, 12, 4).push_back('-');
    uuid.append(hex, 16, 4).push_back('-');
    uuid.append(hex, 20, 12);
    return StatusOr<std::string>(std::move(uuid));
}

StatusOr<std::uint32_t> RandomBelow(std::uint32_t bound) {
    if (bound == 0) {
        return Status::InvalidArgument("bound must be positive");
    }
    // 丢弃落在最后一个不完整区间的取值
    const std::uint32_t limit = std::numeric_limits<std::uint32_t>::max() -
                                (std::numeric_limits<std::uint32_t>::max() % bound);
    while (true) {
        std::uint32_t value = 0;
        auto status = FillRandom(reinterpret_cast<unsigned char*>(&value), sizeof(value));
        if (!status.IsOk()) {
            return status;
        }
        if (value < limit) {
            return StatusOr<std::uint32_t>(value % bound);
        }
    }
}

StatusOr<std::string> Sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        return Status::Internal("EVP_MD_CTX_new failed");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return Status::Internal("SHA-256 digest failed");
    }
    return StatusOr<std::string>(BytesToHex(digest, digest_len));
}

}
}
