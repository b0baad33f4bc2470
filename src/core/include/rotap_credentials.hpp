#ifndef ROTAP_CREDENTIALS_HPP
#define ROTAP_CREDENTIALS_HPP

#include "rotap_config.hpp"

#include <cstdint>
#include <string>

namespace rotap {

struct Credential {
    std::string ssid;
    std::string passphrase;

    bool operator==(const Credential& o) const {
        return ssid == o.ssid && passphrase == o.passphrase;
    }
    bool operator!=(const Credential& o) const { return !(*this == o); }
};

struct CredentialPolicy {
    uint32_t ssid_suffix_length = 6;
    uint32_t passphrase_length = 16;
    bool exclude_ambiguous = false;
    SecurityMode security = SecurityMode::WPA2_PSK;

    static CredentialPolicy from_config(const DaemonConfig& cfg, const InterfaceConfig& ic);
};

/**
 * @brief Produces fresh SSID/passphrase pairs for one interface
 *
 * Every character is drawn independently from the libsodium CSPRNG; no
 * value depends on a previous credential. The generator only remembers
 * the last pair to guarantee that two consecutive results differ.
 */
class CredentialGenerator {
public:
    explicit CredentialGenerator(CredentialPolicy policy);

    /// Throws FatalError if prefix + suffix or passphrase length violate
    /// 802.11 / WPA limits.
    Credential generate(const std::string& prefix);

    const CredentialPolicy& policy() const { return policy_; }

    static const std::string& ssid_alphabet();
    static std::string passphrase_alphabet(bool exclude_ambiguous);

private:
    static std::string random_string(const std::string& alphabet, size_t length);

    CredentialPolicy policy_;
    std::string passphrase_alphabet_;
    Credential last_;
    bool has_last_ = false;
};

/// Stable, non-reversible tag for an SSID (first 16 hex digits of BLAKE2b).
std::string redact_ssid(const std::string& ssid);

} // namespace rotap

#endif // ROTAP_CREDENTIALS_HPP
