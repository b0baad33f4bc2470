#include "../include/rotap_service_manager.hpp"
#include "../include/rotap_logger.hpp"
#include "../include/rotap_process.hpp"

#include <cctype>
#include <utility>

namespace rotap {

// Unit names go to argv verbatim; keep them to systemd's unit alphabet
static bool is_valid_unit(const std::string& unit) {
    if (unit.empty() || unit.size() > 255 || unit[0] == '-') return false;
    for (char c : unit) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) ||
              c == '@' || c == '.' || c == '-' || c == '_' || c == ':' || c == '\\')) {
            return false;
        }
    }
    return true;
}

static std::string first_line(const std::string& s) {
    auto pos = s.find('\n');
    return pos == std::string::npos ? s : s.substr(0, pos);
}

SystemdServiceManager::SystemdServiceManager(std::string systemctl)
    : systemctl_(std::move(systemctl))
{}

bool SystemdServiceManager::restart(const std::string& unit, std::chrono::milliseconds timeout) {
    if (!is_valid_unit(unit)) {
        ROTAP_LOG_ERROR("Refusing to restart invalid unit name: " + unit);
        return false;
    }
    ProcessResult r = run_process({systemctl_, "restart", unit}, timeout);
    if (r.timed_out) {
        ROTAP_LOG_ERROR("Timeout restarting " + unit);
        return false;
    }
    if (r.exit_code != 0) {
        ROTAP_LOG_ERROR(unit + " restart failed: " + first_line(r.output));
        return false;
    }
    ROTAP_LOG_DEBUG(unit + " restarted");
    return true;
}

bool SystemdServiceManager::is_active(const std::string& unit, std::chrono::milliseconds timeout) {
    if (!is_valid_unit(unit)) return false;
    return run_process({systemctl_, "is-active", "--quiet", unit}, timeout).ok();
}

} // namespace rotap
