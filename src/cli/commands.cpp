#include "rotap_commands.hpp"

#include "rotap_config.hpp"
#include "rotap_fs.hpp"
#include "rotap_status_store.hpp"
#include "rotap_trigger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace rotap {
namespace cli {

const char* const DEFAULT_CONFIG_PATH = "/etc/rotap/config.json";

// ============================================================================
// Utility functions
// ============================================================================

std::string get_option(const std::vector<std::string>& args, const std::string& option,
                       const std::string& default_val) {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

std::string get_positional(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].rfind("--", 0) == 0) {
            ++i;
            continue;
        }
        return args[i];
    }
    return "";
}

std::string config_path(const std::vector<std::string>& args) {
    std::string path = get_option(args, "--config");
    if (!path.empty()) return path;
    const char* env = std::getenv("ROTAP_CONFIG");
    return env ? env : DEFAULT_CONFIG_PATH;
}

// ============================================================================
// Handlers
// ============================================================================

int handle_rotate(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::string iface = get_positional(args);
    if (iface.empty()) {
        err << "Usage: rotapd rotate <interface> [--config PATH]\n";
        return EXIT_USAGE;
    }

    try {
        DaemonConfig cfg = load_config_file(config_path(args));
        if (!cfg.find_interface(iface)) {
            err << "[!] " << iface << " is not a configured interface\n";
            return EXIT_FAILURE;
        }

        const std::string path = FileTriggerSource::path_for(cfg.run_dir, iface);
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            err << "[!] Cannot create " << path << ": " << std::strerror(errno) << "\n";
            return EXIT_FAILURE;
        }
        ::close(fd);
        out << "[+] Rotation requested for " << iface << "\n";
        return 0;

    } catch (const std::exception& e) {
        err << "[!] " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}

int handle_status(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    try {
        DaemonConfig cfg = load_config_file(config_path(args));
        StatusStore store(StatusStore::Options::from_config(cfg));

        std::vector<std::string> paths;
        std::string iface = get_positional(args);
        if (!iface.empty()) {
            paths.push_back(store.status_path(iface));
        } else if (fs::file_exists(store.aggregate_path())) {
            paths.push_back(store.aggregate_path());
        } else {
            for (const auto& ic : cfg.managed_interfaces()) {
                paths.push_back(store.status_path(ic.name));
            }
        }

        int rc = 0;
        for (const auto& p : paths) {
            std::string content;
            if (!fs::read_file(p, content)) {
                err << "[!] No status at " << p << "\n";
                rc = EXIT_FAILURE;
                continue;
            }
            out << content;
        }
        return rc;

    } catch (const std::exception& e) {
        err << "[!] " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}

int handle_check_config(const std::vector<std::string>& args, std::ostream& out,
                        std::ostream& err) {
    const std::string path = config_path(args);
    try {
        DaemonConfig cfg = load_config_file(path);
        out << config_to_json(cfg).dump(2) << "\n";

        out << "\nManaged interfaces:";
        for (const auto& ic : cfg.managed_interfaces()) out << " " << ic.name;
        out << "\n[+] " << path << " is valid\n";
        return 0;

    } catch (const std::exception& e) {
        err << "[!] " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}

} // namespace cli
} // namespace rotap
