#ifndef ROTAP_CSPRNG_HPP
#define ROTAP_CSPRNG_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace rotap {

/**
 * @brief libsodium-backed random source
 *
 * init() must succeed before any other call. There is no fallback:
 * if the kernel entropy source is unusable the daemon refuses to run.
 */
class CSPRNG {
public:
    /// Initialise libsodium. Throws FatalError on failure. Idempotent.
    static void init();

    /// Uniform value in [0, upper_bound). upper_bound of 0 or 1 yields 0.
    static uint32_t uniform_uint32(uint32_t upper_bound);

    static std::vector<uint8_t> random_bytes(size_t size);

    /// BLAKE2b digest of data, hex encoded, digest_bytes in [16, 64].
    static std::string digest_hex(const std::string& data, size_t digest_bytes = 32);
};

} // namespace rotap

#endif // ROTAP_CSPRNG_HPP
