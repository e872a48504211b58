#include "pre/kdf.h"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace pre {

namespace {

struct MdCtxDeleter { void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); } };

}  // namespace

/**
 * KDF(secret, length) = SHA256(secret||0) || SHA256(secret||1) || ...
 * 计数器为4字节大端
 */
std::vector<uint8_t> sharedSecretToKeystream(const PairingGroup& group, const GTElement& secret,
                                             size_t length) {
    const std::vector<uint8_t> secret_bytes = group.encode(secret);

    std::vector<uint8_t> keystream(length);
    size_t produced = 0;
    uint32_t counter = 0;
    std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};

    while (produced < length) {
        std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        const uint8_t counter_bytes[4] = {static_cast<uint8_t>((counter >> 24) & 0xFF),
                                          static_cast<uint8_t>((counter >> 16) & 0xFF),
                                          static_cast<uint8_t>((counter >> 8) & 0xFF),
                                          static_cast<uint8_t>(counter & 0xFF)};
        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), secret_bytes.data(), secret_bytes.size()) != 1 ||
            EVP_DigestUpdate(ctx.get(), counter_bytes, sizeof(counter_bytes)) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), digest.data(), nullptr) != 1) {
            throw std::runtime_error("SHA256 digest failed");
        }

        size_t to_copy = std::min(static_cast<size_t>(digest.size()), length - produced);
        std::copy_n(digest.begin(), to_copy, keystream.begin() + produced);
        produced += to_copy;
        ++counter;
    }

    return keystream;
}

std::string toHex(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

}  // namespace pre
