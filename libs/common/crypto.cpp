/**
 * @file crypto.cpp
 * @brief Digests, keyed signatures and random identifiers (OpenSSL)
 */

#include "axiom/common.hpp"

#include <array>
#include <format>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace axiom::common {

namespace {

[[nodiscard]] const EVP_MD* digest_for(HmacAlgorithm algorithm) noexcept
{
    switch (algorithm) {
        case HmacAlgorithm::kSha256:
            return EVP_sha256();
        case HmacAlgorithm::kSha384:
            return EVP_sha384();
        case HmacAlgorithm::kSha512:
            return EVP_sha512();
    }
    return nullptr;
}

}  // namespace

std::string sha256(std::string_view data)
{
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
    return to_hex(std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size()));
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

Result<std::string> hmac_raw(HmacAlgorithm algorithm, std::string_view key, std::string_view data)
{
    const EVP_MD* md = digest_for(algorithm);
    if (md == nullptr) {
        return std::unexpected(Error::make(errc::kValidation, "Unsupported HMAC algorithm"));
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int mac_len = 0;
    const unsigned char* out = HMAC(md,
                                    key.data(),
                                    static_cast<int>(key.size()),
                                    reinterpret_cast<const unsigned char*>(data.data()),
                                    data.size(),
                                    mac.data(),
                                    &mac_len);
    if (out == nullptr) {
        return std::unexpected(Error::make(errc::kIntegrityViolation, "HMAC computation failed"));
    }
    return std::string(reinterpret_cast<const char*>(mac.data()), mac_len);
}

Result<std::string> hmac_sha256_hex(std::string_view key, std::string_view data)
{
    auto mac = hmac_raw(HmacAlgorithm::kSha256, key, data);
    if (!mac) {
        return std::unexpected(mac.error());
    }
    return to_hex(*mac);
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

Result<std::string> random_uuid()
{
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return std::unexpected(Error::make(errc::kPersistence, "RAND_bytes failed to produce an id"));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

}  // namespace axiom::common
