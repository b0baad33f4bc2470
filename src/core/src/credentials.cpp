#include "../include/rotap_credentials.hpp"
#include "../include/rotap_csprng.hpp"
#include "../include/rotap_errors.hpp"

namespace rotap {

static constexpr size_t MAX_SSID_BYTES = 32;
static constexpr size_t MIN_PASSPHRASE = 8;
static constexpr size_t MAX_PASSPHRASE = 63;

CredentialPolicy CredentialPolicy::from_config(const DaemonConfig& cfg,
                                               const InterfaceConfig& ic) {
    CredentialPolicy p;
    p.ssid_suffix_length = cfg.ssid_length;
    p.passphrase_length = cfg.password_length;
    p.exclude_ambiguous = cfg.passphrase_exclude_ambiguous;
    p.security = ic.security;
    return p;
}

CredentialGenerator::CredentialGenerator(CredentialPolicy policy)
    : policy_(policy)
    , passphrase_alphabet_(passphrase_alphabet(policy.exclude_ambiguous))
{}

const std::string& CredentialGenerator::ssid_alphabet() {
    static const std::string alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    return alphabet;
}

std::string CredentialGenerator::passphrase_alphabet(bool exclude_ambiguous) {
    std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    if (exclude_ambiguous) {
        std::string filtered;
        for (char c : alphabet) {
            if (c != '0' && c != 'O' && c != '1' && c != 'l' && c != 'I') {
                filtered.push_back(c);
            }
        }
        return filtered;
    }
    return alphabet;
}

std::string CredentialGenerator::random_string(const std::string& alphabet, size_t length) {
    std::string out;
    out.reserve(length);
    const auto n = static_cast<uint32_t>(alphabet.size());
    for (size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[CSPRNG::uniform_uint32(n)]);
    }
    return out;
}

Credential CredentialGenerator::generate(const std::string& prefix) {
    if (prefix.size() + policy_.ssid_suffix_length > MAX_SSID_BYTES) {
        throw FatalError("SSID prefix '" + prefix + "' leaves no room for a " +
                         std::to_string(policy_.ssid_suffix_length) + " character suffix");
    }
    if (policy_.ssid_suffix_length == 0) {
        throw FatalError("SSID suffix length must be positive");
    }
    if (policy_.passphrase_length < MIN_PASSPHRASE ||
        policy_.passphrase_length > MAX_PASSPHRASE) {
        throw FatalError("Passphrase length " + std::to_string(policy_.passphrase_length) +
                         " outside WPA limits");
    }

    Credential cred;
    do {
        cred.ssid = prefix + random_string(ssid_alphabet(), policy_.ssid_suffix_length);
        cred.passphrase = random_string(passphrase_alphabet_, policy_.passphrase_length);
    } while (has_last_ && (cred.ssid == last_.ssid || cred.passphrase == last_.passphrase));

    last_ = cred;
    has_last_ = true;
    return cred;
}

std::string redact_ssid(const std::string& ssid) {
    return CSPRNG::digest_hex(ssid, 32).substr(0, 16);
}

} // namespace rotap
