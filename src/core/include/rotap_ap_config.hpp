#ifndef ROTAP_AP_CONFIG_HPP
#define ROTAP_AP_CONFIG_HPP

#include "rotap_config.hpp"
#include "rotap_credentials.hpp"
#include "rotap_service_manager.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace rotap {

struct ApplyResult {
    bool ok = false;
    std::string error;

    static ApplyResult success() { return {true, ""}; }
    static ApplyResult failure(std::string why) { return {false, std::move(why)}; }
};

struct ApWriterOptions {
    std::string hostapd_conf_dir = "/etc/hostapd";
    std::string dnsmasq_conf_dir = "/etc/dnsmasq.d";
    std::string hostapd_template;               // empty: built-in rendering
    std::string country_code = "AR";
    std::chrono::milliseconds apply_timeout{15000};
    std::chrono::milliseconds poll_interval{500};

    static ApWriterOptions from_config(const DaemonConfig& cfg);
};

/// hostapd.conf for the interface; byte-identical for identical inputs.
std::string render_hostapd_config(const InterfaceConfig& ic, const Credential& cred,
                                  const std::string& country_code);

/// Substitutes {{INTERFACE}} {{SSID}} {{PASSWORD}} {{CHANNEL}} {{COUNTRY_CODE}}.
std::string render_hostapd_template(const std::string& tmpl, const InterfaceConfig& ic,
                                    const Credential& cred, const std::string& country_code);

/// dnsmasq drop-in serving DHCP/DNS on the AP subnet.
std::string render_dnsmasq_config(const InterfaceConfig& ic);

/**
 * @brief Activates a credential on one interface
 *
 * Owned by a single scheduler: the files and units it touches belong to
 * that interface only. apply() succeeds only once the AP unit reports
 * active, bounded by apply_timeout measured from the start of the call.
 */
class APConfigWriter {
public:
    APConfigWriter(ApWriterOptions options, ServiceManager& services);

    ApplyResult apply(const std::string& interface_name, const Credential& cred,
                      const InterfaceConfig& ic);

    std::string hostapd_conf_path(const std::string& interface_name) const;
    std::string dnsmasq_conf_path(const std::string& interface_name) const;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    ApplyResult apply_dhcp(const InterfaceConfig& ic, Deadline deadline);
    bool restart_and_wait(const std::string& unit, Deadline deadline, std::string& error);
    void restore_hostapd(const std::string& path, bool had_previous, const std::string& previous);

    ApWriterOptions options_;
    ServiceManager& services_;
    bool dhcp_restart_pending_ = false;
};

} // namespace rotap

#endif // ROTAP_AP_CONFIG_HPP
