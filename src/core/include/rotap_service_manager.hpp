#ifndef ROTAP_SERVICE_MANAGER_HPP
#define ROTAP_SERVICE_MANAGER_HPP

#include <chrono>
#include <string>

namespace rotap {

/**
 * @brief Control surface of the init system for hostapd / dnsmasq units
 *
 * Both calls are bounded by the given timeout.
 */
class ServiceManager {
public:
    virtual ~ServiceManager() = default;
    virtual bool restart(const std::string& unit, std::chrono::milliseconds timeout) = 0;
    virtual bool is_active(const std::string& unit, std::chrono::milliseconds timeout) = 0;
};

class SystemdServiceManager : public ServiceManager {
public:
    explicit SystemdServiceManager(std::string systemctl = "systemctl");

    bool restart(const std::string& unit, std::chrono::milliseconds timeout) override;
    bool is_active(const std::string& unit, std::chrono::milliseconds timeout) override;

private:
    std::string systemctl_;
};

} // namespace rotap

#endif // ROTAP_SERVICE_MANAGER_HPP
