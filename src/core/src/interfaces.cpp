#include "../include/rotap_interfaces.hpp"
#include "../include/rotap_fs.hpp"

#include <net/if.h>

namespace rotap {

bool InterfaceProbe::exists(const std::string& name) const {
    return if_nametoindex(name.c_str()) != 0;
}

bool InterfaceProbe::is_wireless(const std::string& name) const {
    return fs::file_exists("/sys/class/net/" + name + "/wireless");
}

} // namespace rotap
