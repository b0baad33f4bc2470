/**
 * @file csprng.cpp
 * @brief Random source for credential generation
 * @note libsodium is REQUIRED - no fallback implementations
 */

#include "../include/rotap_csprng.hpp"
#include "../include/rotap_errors.hpp"

#ifndef HAVE_SODIUM
#error "libsodium is required for credential generation. Please install libsodium and rebuild with -DHAVE_SODIUM=ON"
#endif

#include <sodium.h>

namespace rotap {

void CSPRNG::init() {
    // sodium_init() returns 1 when already initialised
    if (sodium_init() < 0) {
        throw FatalError("Failed to initialize libsodium random source");
    }
}

uint32_t CSPRNG::uniform_uint32(uint32_t upper_bound) {
    if (upper_bound < 2) return 0;
    return randombytes_uniform(upper_bound);
}

std::vector<uint8_t> CSPRNG::random_bytes(size_t size) {
    std::vector<uint8_t> out(size);
    if (size > 0) randombytes_buf(out.data(), size);
    return out;
}

std::string CSPRNG::digest_hex(const std::string& data, size_t digest_bytes) {
    if (digest_bytes < crypto_generichash_BYTES_MIN ||
        digest_bytes > crypto_generichash_BYTES_MAX) {
        throw FatalError("Invalid digest size: " + std::to_string(digest_bytes));
    }

    std::vector<uint8_t> digest(digest_bytes);
    if (crypto_generichash(digest.data(), digest.size(),
                           reinterpret_cast<const unsigned char*>(data.data()),
                           data.size(), nullptr, 0) != 0) {
        throw FatalError("BLAKE2b digest failed");
    }

    std::string hex(digest_bytes * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), digest.data(), digest.size());
    hex.resize(digest_bytes * 2);
    return hex;
}

} // namespace rotap
