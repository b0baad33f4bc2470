#include "rotap_commands.hpp"

#include "rotap_config.hpp"
#include "rotap_csprng.hpp"
#include "rotap_daemon.hpp"
#include "rotap_errors.hpp"
#include "rotap_logger.hpp"
#include "rotap_trigger.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace rotap;
using cli::EXIT_USAGE;

static const char* const VERSION = "v1.0.0";

// ============================================================================
// Signal handling (flags only; work happens on the daemon thread)
// ============================================================================

static std::atomic<bool> g_running(true);
static std::atomic<bool> g_reopen_log(false);

extern "C" void signal_handler(int signal) {
    switch (signal) {
        case SIGINT:
        case SIGTERM: g_running = false; break;
        case SIGHUP:  g_reopen_log = true; break;
        case SIGUSR1: SignalTriggerSource::notify(); break;
        default: break;
    }
}

static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGUSR1}) {
        sigaction(sig, &sa, nullptr);
    }
    signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<int(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<int(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    int parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return EXIT_USAGE;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return EXIT_USAGE;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - rotating kiosk access point daemon\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static void configure_logging(const DaemonConfig& cfg, const std::vector<std::string>& args) {
    auto& logger = Logger::instance();
    std::string level = cli::get_option(args, "--log-level", cfg.log_level);
    if (!Logger::isLevelName(level)) {
        ROTAP_LOG_WARN("Unknown log level '" + level + "', using info");
    }
    logger.setLevel(Logger::levelFromString(level));
    if (!cfg.log_file.empty() && !logger.setFileOutput(cfg.log_file)) {
        ROTAP_LOG_WARN("Cannot open log file " + cfg.log_file + ", logging to console only");
    }
}

// ============================================================================
// Handlers
// ============================================================================

static int handle_run(const std::vector<std::string>& args) {
    try {
        const std::string path = cli::config_path(args);
        DaemonConfig cfg = load_config_file(path);
        configure_logging(cfg, args);
        ROTAP_LOG_INFO("Loaded config from " + path);

        CSPRNG::init();

        install_signal_handlers();

        Daemon daemon(cfg);
        daemon.initialize();
        return daemon.run(g_running, g_reopen_log);

    } catch (const ConfigError& e) {
        ROTAP_LOG_FATAL(e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        ROTAP_LOG_FATAL(std::string("Startup failed: ") + e.what());
        return EXIT_FAILURE;
    }
}

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    ArgumentParser parser("rotapd", VERSION);

    parser.add_command("run", "Run the rotation daemon in the foreground", handle_run,
                       {"[--config PATH]", "[--log-level LEVEL]"});
    parser.add_command("rotate", "Request an immediate rotation",
                       [](const std::vector<std::string>& args) {
                           return cli::handle_rotate(args, std::cout, std::cerr);
                       },
                       {"<interface>", "[--config PATH]"});
    parser.add_command("status", "Print published status",
                       [](const std::vector<std::string>& args) {
                           return cli::handle_status(args, std::cout, std::cerr);
                       },
                       {"[<interface>]", "[--config PATH]"});
    parser.add_command("check-config", "Validate configuration and print effective values",
                       [](const std::vector<std::string>& args) {
                           return cli::handle_check_config(args, std::cout, std::cerr);
                       },
                       {"[--config PATH]"});

    return parser.parse_and_execute(argc, argv);
}
