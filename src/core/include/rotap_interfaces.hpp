#ifndef ROTAP_INTERFACES_HPP
#define ROTAP_INTERFACES_HPP

#include <string>

namespace rotap {

/**
 * @brief Host network interface lookup
 *
 * Used once at startup to skip configured APs whose dongle is absent.
 */
class InterfaceProbe {
public:
    virtual ~InterfaceProbe() = default;

    virtual bool exists(const std::string& name) const;
    virtual bool is_wireless(const std::string& name) const;
};

} // namespace rotap

#endif // ROTAP_INTERFACES_HPP
