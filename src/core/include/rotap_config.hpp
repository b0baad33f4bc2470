#ifndef ROTAP_CONFIG_HPP
#define ROTAP_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace rotap {

enum class SecurityMode {
    WPA2_PSK,       // wpa=2, WPA-PSK
    WPA3_SAE,       // wpa=2, SAE, PMF required
    WPA2_WPA3       // transition mode, PMF optional
};

const char* security_mode_name(SecurityMode mode);
bool parse_security_mode(const std::string& s, SecurityMode& out);

/// Interface names usable on argv and in file names: [A-Za-z0-9._-]{1,15}
bool is_valid_ifname(const std::string& name);

/**
 * @brief Per-interface AP settings, immutable once loaded
 *
 * Rotation knobs default to the global values of the document and can
 * be overridden inside the interface block.
 */
struct InterfaceConfig {
    std::string name;
    bool enabled = true;

    std::string ap_ip;
    std::string ap_netmask = "255.255.255.0";
    std::string dhcp_range_start;
    std::string dhcp_range_end;
    std::string dhcp_lease_time = "4h";
    int channel = 6;

    std::string ssid_prefix = "ssb-";
    SecurityMode security = SecurityMode::WPA2_PSK;

    uint32_t rotation_interval_sec = 300;
    uint32_t client_threshold = 5;
    uint32_t min_time_after_clients_sec = 120;

    std::string ap_service;     // systemd unit running hostapd for this interface
    std::string dhcp_service;   // systemd unit running dnsmasq for this interface
};

struct DaemonConfig {
    // Rotation policy (global defaults)
    uint32_t rotation_interval_sec = 300;
    uint32_t client_threshold = 5;
    uint32_t min_time_after_clients_sec = 120;
    uint32_t manual_rotation_cooldown_sec = 30;

    // Credential shape
    std::string ssid_prefix = "ssb-";
    uint32_t ssid_length = 6;
    uint32_t password_length = 16;
    bool passphrase_exclude_ambiguous = false;
    SecurityMode security = SecurityMode::WPA2_PSK;
    std::string country_code = "AR";

    // Topology
    std::string wan_interface = "eth0";
    bool dual_ap_mode = false;
    std::vector<InterfaceConfig> interfaces;    // sorted by name

    // Timing
    uint32_t tick_interval_ms = 1000;
    uint32_t apply_timeout_sec = 15;
    uint32_t apply_retry_delay_sec = 5;
    uint32_t client_query_timeout_ms = 2000;

    // Paths
    std::string run_dir = "/run/rotap";
    std::string log_dir = "/var/log/rotap";
    std::string hostapd_conf_dir = "/etc/hostapd";
    std::string dnsmasq_conf_dir = "/etc/dnsmasq.d";
    std::string hostapd_template;

    // Logging
    std::string log_level = "info";
    std::string log_file;
    uint64_t history_max_bytes = 1024 * 1024;

    /// Interfaces the daemon should run: all enabled ones in dual mode,
    /// otherwise only the first enabled one.
    std::vector<InterfaceConfig> managed_interfaces() const;

    const InterfaceConfig* find_interface(const std::string& name) const;
};

/// Parse and validate a configuration document. Throws ConfigError.
DaemonConfig parse_config(const nlohmann::json& doc);
DaemonConfig parse_config_text(const std::string& text);
DaemonConfig load_config_file(const std::string& path);

/// Effective configuration, as printed by `rotapd check-config`.
nlohmann::json config_to_json(const DaemonConfig& cfg);

} // namespace rotap

#endif // ROTAP_CONFIG_HPP
