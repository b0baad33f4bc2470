/**
 * @file ap_config_writer.cpp
 * @brief hostapd / dnsmasq configuration rendering and activation
 *
 * Order of operations in apply():
 *   1. DHCP drop-in, only when its content differs from the live file
 *      (or a previous DHCP restart did not complete)
 *   2. hostapd.conf via staging file + rename
 *   3. restart the AP unit and poll until it reports active
 * DHCP goes first because it does not depend on the credential: if it
 * fails, hostapd still serves the credential of record.
 */

#include "../include/rotap_ap_config.hpp"
#include "../include/rotap_fs.hpp"
#include "../include/rotap_logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include <unistd.h>

namespace rotap {

static constexpr mode_t HOSTAPD_CONF_MODE = 0600;
static constexpr mode_t DNSMASQ_CONF_MODE = 0644;
static constexpr mode_t CONF_DIR_MODE = 0755;
static constexpr std::chrono::milliseconds MAX_PROBE_TIMEOUT{5000};

ApWriterOptions ApWriterOptions::from_config(const DaemonConfig& cfg) {
    ApWriterOptions o;
    o.hostapd_conf_dir = cfg.hostapd_conf_dir;
    o.dnsmasq_conf_dir = cfg.dnsmasq_conf_dir;
    o.hostapd_template = cfg.hostapd_template;
    o.country_code = cfg.country_code;
    o.apply_timeout = std::chrono::seconds(cfg.apply_timeout_sec);
    return o;
}

// ==================== Rendering ====================

std::string render_hostapd_config(const InterfaceConfig& ic, const Credential& cred,
                                  const std::string& country_code) {
    std::ostringstream out;
    out << "# Generated by rotapd - changes are overwritten on every rotation\n"
        << "interface=" << ic.name << "\n"
        << "driver=nl80211\n"
        << "ssid=" << cred.ssid << "\n"
        << "utf8_ssid=0\n"
        << "hw_mode=" << (ic.channel <= 14 ? "g" : "a") << "\n"
        << "channel=" << ic.channel << "\n"
        << "country_code=" << country_code << "\n"
        << "ieee80211d=1\n"
        << "ieee80211n=1\n"
        << "wmm_enabled=1\n"
        << "macaddr_acl=0\n"
        << "ignore_broadcast_ssid=0\n"
        << "auth_algs=1\n"
        << "wpa=2\n"
        << "rsn_pairwise=CCMP\n";

    switch (ic.security) {
        case SecurityMode::WPA2_PSK:
            out << "wpa_key_mgmt=WPA-PSK\n"
                << "wpa_passphrase=" << cred.passphrase << "\n";
            break;
        case SecurityMode::WPA3_SAE:
            out << "wpa_key_mgmt=SAE\n"
                << "ieee80211w=2\n"
                << "sae_require_mfp=1\n"
                << "sae_password=" << cred.passphrase << "\n";
            break;
        case SecurityMode::WPA2_WPA3:
            out << "wpa_key_mgmt=WPA-PSK SAE\n"
                << "ieee80211w=1\n"
                << "wpa_passphrase=" << cred.passphrase << "\n"
                << "sae_password=" << cred.passphrase << "\n";
            break;
    }
    return out.str();
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string render_hostapd_template(const std::string& tmpl, const InterfaceConfig& ic,
                                    const Credential& cred, const std::string& country_code) {
    std::string out = tmpl;
    replace_all(out, "{{INTERFACE}}", ic.name);
    replace_all(out, "{{SSID}}", cred.ssid);
    replace_all(out, "{{PASSWORD}}", cred.passphrase);
    replace_all(out, "{{CHANNEL}}", std::to_string(ic.channel));
    replace_all(out, "{{COUNTRY_CODE}}", country_code);
    return out;
}

std::string render_dnsmasq_config(const InterfaceConfig& ic) {
    std::ostringstream out;
    out << "# Generated by rotapd for " << ic.name << "\n"
        << "interface=" << ic.name << "\n"
        << "bind-interfaces\n"
        << "dhcp-range=" << ic.dhcp_range_start << "," << ic.dhcp_range_end << ","
        << ic.ap_netmask << "," << ic.dhcp_lease_time << "\n"
        << "dhcp-option=option:router," << ic.ap_ip << "\n"
        << "dhcp-option=option:dns-server," << ic.ap_ip << "\n"
        << "dhcp-authoritative\n";
    return out.str();
}

// ==================== APConfigWriter ====================

APConfigWriter::APConfigWriter(ApWriterOptions options, ServiceManager& services)
    : options_(std::move(options))
    , services_(services)
{}

std::string APConfigWriter::hostapd_conf_path(const std::string& interface_name) const {
    return fs::join(options_.hostapd_conf_dir, "hostapd-" + interface_name + ".conf");
}

std::string APConfigWriter::dnsmasq_conf_path(const std::string& interface_name) const {
    return fs::join(options_.dnsmasq_conf_dir, "rotap-" + interface_name + ".conf");
}

bool APConfigWriter::restart_and_wait(const std::string& unit, Deadline deadline,
                                      std::string& error) {
    auto remaining = [&]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    };

    if (remaining().count() <= 0 || !services_.restart(unit, remaining())) {
        error = "failed to restart " + unit;
        return false;
    }

    while (true) {
        auto left = remaining();
        if (left.count() <= 0) break;
        if (services_.is_active(unit, std::min(left, MAX_PROBE_TIMEOUT))) return true;

        left = remaining();
        if (left.count() <= 0) break;
        std::this_thread::sleep_for(std::min(left, options_.poll_interval));
    }
    error = unit + " did not become active within " +
            std::to_string(options_.apply_timeout.count() / 1000) + "s";
    return false;
}

ApplyResult APConfigWriter::apply_dhcp(const InterfaceConfig& ic, Deadline deadline) {
    const std::string path = dnsmasq_conf_path(ic.name);
    const std::string rendered = render_dnsmasq_config(ic);

    std::string current;
    bool unchanged = fs::read_file(path, current) && current == rendered;
    if (unchanged && !dhcp_restart_pending_) return ApplyResult::success();

    if (!unchanged) {
        std::string err;
        if (!fs::atomic_write_file(path, rendered, DNSMASQ_CONF_MODE, &err)) {
            return ApplyResult::failure("dnsmasq config: " + err);
        }
        ROTAP_LOG_INFO("[" + ic.name + "] DHCP lease configuration changed");
    }
    dhcp_restart_pending_ = true;

    std::string err;
    if (!restart_and_wait(ic.dhcp_service, deadline, err)) {
        return ApplyResult::failure(err);
    }
    dhcp_restart_pending_ = false;
    return ApplyResult::success();
}

void APConfigWriter::restore_hostapd(const std::string& path, bool had_previous,
                                     const std::string& previous) {
    if (!had_previous) {
        // First apply on this host: the unpublished credential must not stay behind
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            ROTAP_LOG_WARN("Could not remove unapplied hostapd config " + path + ": " +
                           std::strerror(errno));
        }
        return;
    }
    std::string err;
    if (!fs::atomic_write_file(path, previous, HOSTAPD_CONF_MODE, &err)) {
        ROTAP_LOG_WARN("Could not restore previous hostapd config: " + err);
    }
}

ApplyResult APConfigWriter::apply(const std::string& interface_name, const Credential& cred,
                                  const InterfaceConfig& ic) {
    const Deadline deadline = std::chrono::steady_clock::now() + options_.apply_timeout;

    std::string dir_err;
    if (!fs::ensure_directory(options_.dnsmasq_conf_dir, CONF_DIR_MODE, &dir_err) ||
        !fs::ensure_directory(options_.hostapd_conf_dir, CONF_DIR_MODE, &dir_err)) {
        return ApplyResult::failure("config directory: " + dir_err);
    }

    ApplyResult dhcp = apply_dhcp(ic, deadline);
    if (!dhcp.ok) return dhcp;

    // 1. Render
    std::string rendered;
    if (options_.hostapd_template.empty()) {
        rendered = render_hostapd_config(ic, cred, options_.country_code);
    } else {
        std::string tmpl;
        if (!fs::read_file(options_.hostapd_template, tmpl)) {
            return ApplyResult::failure("hostapd template not readable: " +
                                        options_.hostapd_template);
        }
        rendered = render_hostapd_template(tmpl, ic, cred, options_.country_code);
    }

    // 2. Stage + rename; keep the old content so a failed apply can put it back
    const std::string path = hostapd_conf_path(interface_name);
    std::string previous;
    bool had_previous = fs::read_file(path, previous);

    std::string err;
    if (!fs::atomic_write_file(path, rendered, HOSTAPD_CONF_MODE, &err)) {
        return ApplyResult::failure("hostapd config: " + err);
    }

    // 3+4. Restart this interface's AP unit and wait for it
    if (!restart_and_wait(ic.ap_service, deadline, err)) {
        restore_hostapd(path, had_previous, previous);
        return ApplyResult::failure(err);
    }
    return ApplyResult::success();
}

} // namespace rotap
