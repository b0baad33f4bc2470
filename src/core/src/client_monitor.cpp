#include "../include/rotap_client_monitor.hpp"
#include "../include/rotap_config.hpp"
#include "../include/rotap_logger.hpp"
#include "../include/rotap_process.hpp"

#include <sstream>
#include <utility>

namespace rotap {

IwClientMonitor::IwClientMonitor(std::chrono::milliseconds timeout, std::string iw_binary)
    : timeout_(timeout)
    , iw_binary_(std::move(iw_binary))
{}

uint32_t IwClientMonitor::parse_station_dump(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    uint32_t count = 0;
    while (std::getline(in, line)) {
        std::istringstream words(line);
        std::string first;
        if (words >> first && first == "Station") ++count;
    }
    return count;
}

std::optional<uint32_t> IwClientMonitor::count(const std::string& interface_name) {
    if (!is_valid_ifname(interface_name)) return std::nullopt;

    ProcessResult r = run_process({iw_binary_, "dev", interface_name, "station", "dump"},
                                  timeout_);
    if (r.timed_out) {
        ROTAP_LOG_DEBUG("[" + interface_name + "] station dump timed out");
        return std::nullopt;
    }
    if (r.exit_code != 0) {
        ROTAP_LOG_DEBUG("[" + interface_name + "] station dump failed (exit " +
                        std::to_string(r.exit_code) + ")");
        return std::nullopt;
    }
    return parse_station_dump(r.output);
}

} // namespace rotap
