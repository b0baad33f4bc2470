#ifndef ROTAP_CLIENT_MONITOR_HPP
#define ROTAP_CLIENT_MONITOR_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rotap {

/**
 * @brief Associated-station counter
 *
 * std::nullopt means "unknown" and must never be read as zero clients:
 * the scheduler treats it as not meeting the client threshold.
 */
class ClientMonitor {
public:
    virtual ~ClientMonitor() = default;
    virtual std::optional<uint32_t> count(const std::string& interface_name) = 0;
};

/// Counts stations reported by `iw dev <iface> station dump`.
class IwClientMonitor : public ClientMonitor {
public:
    explicit IwClientMonitor(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000),
                             std::string iw_binary = "iw");

    std::optional<uint32_t> count(const std::string& interface_name) override;

    /// Number of lines whose first token is "Station".
    static uint32_t parse_station_dump(const std::string& output);

private:
    std::chrono::milliseconds timeout_;
    std::string iw_binary_;
};

} // namespace rotap

#endif // ROTAP_CLIENT_MONITOR_HPP
