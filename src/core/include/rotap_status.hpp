#ifndef ROTAP_STATUS_HPP
#define ROTAP_STATUS_HPP

#include "rotap_config.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rotap {

enum class InterfaceState {
    IDLE,           // serving the credential of record
    ROTATING,       // rotation transaction in progress
    DEGRADED,       // last apply failed, stale credential served, retry pending
    DISABLED        // interface missing on this host
};

enum class RotationReason {
    STARTUP,
    TIME_ELAPSED,
    CLIENT_THRESHOLD,
    MANUAL_TRIGGER
};

const char* interface_state_name(InterfaceState state);
const char* rotation_reason_name(RotationReason reason);

struct DaemonHealth {
    std::optional<int64_t> last_success_at;
    std::string last_error;                 // empty when the last apply succeeded
    std::optional<int64_t> last_error_at;
    uint32_t consecutive_failures = 0;
};

/**
 * @brief What display server and status indicator read, per interface
 *
 * Contains the passphrase: the file is mode 0640 and never leaves the host.
 */
struct PublishedStatus {
    std::string interface_name;
    bool enabled = true;
    InterfaceState state = InterfaceState::ROTATING;
    std::string ssid;
    std::string passphrase;
    SecurityMode security = SecurityMode::WPA2_PSK;
    int channel = 0;
    uint64_t sequence = 0;
    int64_t created_at = 0;             // UNIX seconds, 0 before first rotation
    int64_t expires_at = 0;             // updated_at + seconds_until_next
    int64_t seconds_until_next = 0;
    std::optional<uint32_t> client_count;
    std::string last_rotation_reason;
    DaemonHealth health;
    int64_t updated_at = 0;
};

struct RotationHistoryEntry {
    int64_t time = 0;                   // UNIX seconds
    std::string interface_name;
    RotationReason reason = RotationReason::STARTUP;
    uint64_t sequence = 0;
    std::optional<std::string> prior_ssid_hash;
    std::optional<uint32_t> client_count;
};

} // namespace rotap

#endif // ROTAP_STATUS_HPP
