/**
 * @file config.cpp
 * @brief JSON configuration loading and validation for rotapd
 *
 * The document is validated completely at startup. Wrong types are
 * rejected rather than coerced so that a quoted "300" cannot silently
 * become a different rotation cadence than the operator intended.
 */

#include "../include/rotap_config.hpp"
#include "../include/rotap_errors.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace rotap {

using nlohmann::json;

static constexpr size_t MAX_SSID_BYTES = 32;
static constexpr uint32_t MIN_PASSPHRASE = 8;
static constexpr uint32_t MAX_PASSPHRASE = 63;

const char* security_mode_name(SecurityMode mode) {
    switch (mode) {
        case SecurityMode::WPA2_PSK:  return "wpa2";
        case SecurityMode::WPA3_SAE:  return "wpa3";
        case SecurityMode::WPA2_WPA3: return "wpa2-wpa3";
    }
    return "wpa2";
}

bool parse_security_mode(const std::string& s, SecurityMode& out) {
    if (s == "wpa2")      { out = SecurityMode::WPA2_PSK;  return true; }
    if (s == "wpa3")      { out = SecurityMode::WPA3_SAE;  return true; }
    if (s == "wpa2-wpa3") { out = SecurityMode::WPA2_WPA3; return true; }
    return false;
}

bool is_valid_ifname(const std::string& name) {
    if (name.empty() || name.size() > 15) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) ||
              c == '.' || c == '-' || c == '_')) {
            return false;
        }
    }
    return true;
}

// ==================== Typed field access ====================

static uint64_t get_uint(const json& obj, const std::string& key, uint64_t def,
                         uint64_t min_val = 0,
                         uint64_t max_val = std::numeric_limits<uint32_t>::max()) {
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    if (!it->is_number_integer()) {
        throw ConfigError("'" + key + "' must be an integer");
    }
    if (it->is_number_unsigned()) {
        uint64_t v = it->get<uint64_t>();
        if (v < min_val || v > max_val) {
            throw ConfigError("'" + key + "' out of range [" + std::to_string(min_val) +
                              ", " + std::to_string(max_val) + "]: " + std::to_string(v));
        }
        return v;
    }
    int64_t v = it->get<int64_t>();
    if (v < 0 || static_cast<uint64_t>(v) < min_val || static_cast<uint64_t>(v) > max_val) {
        throw ConfigError("'" + key + "' out of range [" + std::to_string(min_val) +
                          ", " + std::to_string(max_val) + "]: " + std::to_string(v));
    }
    return static_cast<uint64_t>(v);
}

static uint32_t get_u32(const json& obj, const std::string& key, uint32_t def,
                        uint32_t min_val = 0,
                        uint32_t max_val = std::numeric_limits<uint32_t>::max()) {
    return static_cast<uint32_t>(get_uint(obj, key, def, min_val, max_val));
}

static bool get_bool(const json& obj, const std::string& key, bool def) {
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    if (!it->is_boolean()) throw ConfigError("'" + key + "' must be a boolean");
    return it->get<bool>();
}

static std::string get_string(const json& obj, const std::string& key, const std::string& def) {
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    if (!it->is_string()) throw ConfigError("'" + key + "' must be a string");
    return it->get<std::string>();
}

// ==================== Value validation ====================

static bool is_ipv4(const std::string& s) {
    in_addr addr{};
    return inet_pton(AF_INET, s.c_str(), &addr) == 1;
}

static void require_ipv4(const std::string& iface, const std::string& key, const std::string& v) {
    if (!is_ipv4(v)) {
        throw ConfigError("interface " + iface + ": '" + key + "' is not an IPv4 address: " + v);
    }
}

// "a.b.c.d" -> "a.b.c.<host>"
static std::string host_in_subnet(const std::string& ip, int host) {
    auto pos = ip.rfind('.');
    return ip.substr(0, pos + 1) + std::to_string(host);
}

static bool is_lease_time(const std::string& s) {
    if (s == "infinite") return true;
    if (s.empty()) return false;
    size_t digits = 0;
    while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits]))) ++digits;
    if (digits == 0) return false;
    if (digits == s.size()) return true;
    return digits + 1 == s.size() && std::string("smhd").find(s.back()) != std::string::npos;
}

// Printable ASCII only: the prefix ends up on a line of hostapd.conf
static void validate_prefix(const std::string& where, const std::string& prefix,
                            uint32_t ssid_length) {
    for (char c : prefix) {
        if (c < 0x20 || c > 0x7e) {
            throw ConfigError(where + ": 'ssid_prefix' must be printable ASCII");
        }
    }
    if (prefix.size() + ssid_length > MAX_SSID_BYTES) {
        throw ConfigError(where + ": 'ssid_prefix' + 'ssid_length' exceeds " +
                          std::to_string(MAX_SSID_BYTES) + " bytes");
    }
}

static SecurityMode get_security(const json& obj, SecurityMode def, const std::string& where) {
    if (obj.find("security") == obj.end()) return def;
    std::string s = get_string(obj, "security", "");
    SecurityMode mode;
    if (!parse_security_mode(s, mode)) {
        throw ConfigError(where + ": unknown security mode '" + s +
                          "' (expected wpa2, wpa3 or wpa2-wpa3)");
    }
    return mode;
}

static InterfaceConfig parse_interface(const std::string& name, const json& block,
                                       const DaemonConfig& cfg) {
    if (!is_valid_ifname(name)) {
        throw ConfigError("invalid interface name: '" + name + "'");
    }
    if (!block.is_object()) {
        throw ConfigError("interface " + name + ": block must be an object");
    }

    InterfaceConfig ic;
    ic.name = name;
    ic.enabled = get_bool(block, "enabled", true);

    if (block.find("ap_ip") == block.end()) {
        throw ConfigError("interface " + name + ": missing required field 'ap_ip'");
    }
    ic.ap_ip = get_string(block, "ap_ip", "");
    require_ipv4(name, "ap_ip", ic.ap_ip);

    ic.ap_netmask = get_string(block, "ap_netmask", ic.ap_netmask);
    require_ipv4(name, "ap_netmask", ic.ap_netmask);

    ic.dhcp_range_start = get_string(block, "dhcp_range_start", host_in_subnet(ic.ap_ip, 10));
    ic.dhcp_range_end = get_string(block, "dhcp_range_end", host_in_subnet(ic.ap_ip, 100));
    require_ipv4(name, "dhcp_range_start", ic.dhcp_range_start);
    require_ipv4(name, "dhcp_range_end", ic.dhcp_range_end);

    ic.dhcp_lease_time = get_string(block, "dhcp_lease_time", ic.dhcp_lease_time);
    if (!is_lease_time(ic.dhcp_lease_time)) {
        throw ConfigError("interface " + name + ": invalid 'dhcp_lease_time': " +
                          ic.dhcp_lease_time);
    }

    ic.channel = static_cast<int>(get_u32(block, "channel", 6, 1, 196));

    ic.ssid_prefix = get_string(block, "ssid_prefix", cfg.ssid_prefix);
    validate_prefix("interface " + name, ic.ssid_prefix, cfg.ssid_length);
    ic.security = get_security(block, cfg.security, "interface " + name);

    ic.rotation_interval_sec = get_u32(block, "rotation_interval_sec", cfg.rotation_interval_sec);
    ic.client_threshold = get_u32(block, "client_threshold", cfg.client_threshold, 1);
    ic.min_time_after_clients_sec =
        get_u32(block, "min_time_after_clients_sec", cfg.min_time_after_clients_sec);

    // Single AP mode uses the distribution units, dual mode the templated ones
    ic.ap_service = get_string(block, "ap_service",
                               cfg.dual_ap_mode ? "hostapd@" + name : "hostapd");
    ic.dhcp_service = get_string(block, "dhcp_service",
                                 cfg.dual_ap_mode ? "dnsmasq@" + name : "dnsmasq");
    if (ic.ap_service.empty() || ic.dhcp_service.empty()) {
        throw ConfigError("interface " + name + ": service unit names must not be empty");
    }
    return ic;
}

// ==================== Public API ====================

DaemonConfig parse_config(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("top-level document must be an object");
    }

    DaemonConfig cfg;

    cfg.rotation_interval_sec = get_u32(doc, "rotation_interval_sec", cfg.rotation_interval_sec);
    cfg.client_threshold = get_u32(doc, "client_threshold", cfg.client_threshold, 1);
    cfg.min_time_after_clients_sec =
        get_u32(doc, "min_time_after_clients_sec", cfg.min_time_after_clients_sec);
    cfg.manual_rotation_cooldown_sec =
        get_u32(doc, "manual_rotation_cooldown_sec", cfg.manual_rotation_cooldown_sec);

    cfg.ssid_prefix = get_string(doc, "ssid_prefix", cfg.ssid_prefix);
    cfg.ssid_length = get_u32(doc, "ssid_length", cfg.ssid_length, 4, MAX_SSID_BYTES);
    validate_prefix("global", cfg.ssid_prefix, cfg.ssid_length);
    cfg.password_length = get_u32(doc, "password_length", cfg.password_length,
                                  MIN_PASSPHRASE, MAX_PASSPHRASE);
    cfg.passphrase_exclude_ambiguous =
        get_bool(doc, "passphrase_exclude_ambiguous", cfg.passphrase_exclude_ambiguous);
    cfg.security = get_security(doc, cfg.security, "global");

    cfg.country_code = get_string(doc, "country_code", cfg.country_code);
    if (cfg.country_code.size() != 2 ||
        !std::isupper(static_cast<unsigned char>(cfg.country_code[0])) ||
        !std::isupper(static_cast<unsigned char>(cfg.country_code[1]))) {
        throw ConfigError("'country_code' must be two upper-case letters");
    }

    cfg.wan_interface = get_string(doc, "wan_interface", cfg.wan_interface);
    if (!is_valid_ifname(cfg.wan_interface)) {
        throw ConfigError("invalid 'wan_interface': '" + cfg.wan_interface + "'");
    }
    cfg.dual_ap_mode = get_bool(doc, "dual_ap_mode", cfg.dual_ap_mode);

    cfg.tick_interval_ms = get_u32(doc, "tick_interval_ms", cfg.tick_interval_ms, 100, 5000);
    cfg.apply_timeout_sec = get_u32(doc, "apply_timeout_sec", cfg.apply_timeout_sec, 1, 120);
    cfg.apply_retry_delay_sec = get_u32(doc, "apply_retry_delay_sec", cfg.apply_retry_delay_sec);
    cfg.client_query_timeout_ms =
        get_u32(doc, "client_query_timeout_ms", cfg.client_query_timeout_ms, 100, 10000);

    cfg.run_dir = get_string(doc, "run_dir", cfg.run_dir);
    cfg.log_dir = get_string(doc, "log_dir", cfg.log_dir);
    cfg.hostapd_conf_dir = get_string(doc, "hostapd_conf_dir", cfg.hostapd_conf_dir);
    cfg.dnsmasq_conf_dir = get_string(doc, "dnsmasq_conf_dir", cfg.dnsmasq_conf_dir);
    cfg.hostapd_template = get_string(doc, "hostapd_template", cfg.hostapd_template);
    for (const auto* dir : {&cfg.run_dir, &cfg.log_dir,
                            &cfg.hostapd_conf_dir, &cfg.dnsmasq_conf_dir}) {
        if (dir->empty()) throw ConfigError("directory paths must not be empty");
    }

    cfg.log_level = get_string(doc, "log_level", cfg.log_level);
    std::string lvl = cfg.log_level;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::tolower);
    if (lvl != "trace" && lvl != "debug" && lvl != "info" && lvl != "warn" &&
        lvl != "warning" && lvl != "error" && lvl != "fatal" && lvl != "none") {
        throw ConfigError("unknown 'log_level': " + cfg.log_level);
    }
    cfg.log_level = lvl;
    cfg.log_file = get_string(doc, "log_file", cfg.log_file);
    cfg.history_max_bytes = get_uint(doc, "history_max_bytes", cfg.history_max_bytes,
                                     0, std::numeric_limits<int64_t>::max());

    auto ifs = doc.find("interfaces");
    if (ifs == doc.end()) {
        throw ConfigError("missing required field 'interfaces'");
    }
    if (!ifs->is_object() || ifs->empty()) {
        throw ConfigError("'interfaces' must be a non-empty object keyed by interface name");
    }
    // json objects iterate in key order, so interfaces come out sorted
    for (auto it = ifs->begin(); it != ifs->end(); ++it) {
        cfg.interfaces.push_back(parse_interface(it.key(), it.value(), cfg));
    }

    return cfg;
}

DaemonConfig parse_config_text(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed JSON: ") + e.what());
    }
    return parse_config(doc);
}

DaemonConfig load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw ConfigError("failed reading " + path);
    }
    return parse_config_text(ss.str());
}

std::vector<InterfaceConfig> DaemonConfig::managed_interfaces() const {
    std::vector<InterfaceConfig> result;
    for (const auto& ic : interfaces) {
        if (!ic.enabled) continue;
        result.push_back(ic);
        if (!dual_ap_mode) break;
    }
    return result;
}

const InterfaceConfig* DaemonConfig::find_interface(const std::string& name) const {
    for (const auto& ic : interfaces) {
        if (ic.name == name) return &ic;
    }
    return nullptr;
}

json config_to_json(const DaemonConfig& cfg) {
    json j;
    j["rotation_interval_sec"] = cfg.rotation_interval_sec;
    j["client_threshold"] = cfg.client_threshold;
    j["min_time_after_clients_sec"] = cfg.min_time_after_clients_sec;
    j["manual_rotation_cooldown_sec"] = cfg.manual_rotation_cooldown_sec;
    j["ssid_prefix"] = cfg.ssid_prefix;
    j["ssid_length"] = cfg.ssid_length;
    j["password_length"] = cfg.password_length;
    j["passphrase_exclude_ambiguous"] = cfg.passphrase_exclude_ambiguous;
    j["security"] = security_mode_name(cfg.security);
    j["country_code"] = cfg.country_code;
    j["wan_interface"] = cfg.wan_interface;
    j["dual_ap_mode"] = cfg.dual_ap_mode;
    j["tick_interval_ms"] = cfg.tick_interval_ms;
    j["apply_timeout_sec"] = cfg.apply_timeout_sec;
    j["apply_retry_delay_sec"] = cfg.apply_retry_delay_sec;
    j["client_query_timeout_ms"] = cfg.client_query_timeout_ms;
    j["run_dir"] = cfg.run_dir;
    j["log_dir"] = cfg.log_dir;
    j["hostapd_conf_dir"] = cfg.hostapd_conf_dir;
    j["dnsmasq_conf_dir"] = cfg.dnsmasq_conf_dir;
    j["hostapd_template"] = cfg.hostapd_template;
    j["log_level"] = cfg.log_level;
    j["log_file"] = cfg.log_file;
    j["history_max_bytes"] = cfg.history_max_bytes;

    json ifs = json::object();
    for (const auto& ic : cfg.interfaces) {
        json b;
        b["enabled"] = ic.enabled;
        b["ap_ip"] = ic.ap_ip;
        b["ap_netmask"] = ic.ap_netmask;
        b["dhcp_range_start"] = ic.dhcp_range_start;
        b["dhcp_range_end"] = ic.dhcp_range_end;
        b["dhcp_lease_time"] = ic.dhcp_lease_time;
        b["channel"] = ic.channel;
        b["ssid_prefix"] = ic.ssid_prefix;
        b["security"] = security_mode_name(ic.security);
        b["rotation_interval_sec"] = ic.rotation_interval_sec;
        b["client_threshold"] = ic.client_threshold;
        b["min_time_after_clients_sec"] = ic.min_time_after_clients_sec;
        b["ap_service"] = ic.ap_service;
        b["dhcp_service"] = ic.dhcp_service;
        ifs[ic.name] = b;
    }
    j["interfaces"] = ifs;
    return j;
}

} // namespace rotap
