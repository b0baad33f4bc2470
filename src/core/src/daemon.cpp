#include "../include/rotap_daemon.hpp"
#include "../include/rotap_errors.hpp"
#include "../include/rotap_fs.hpp"
#include "../include/rotap_logger.hpp"
#include "../include/rotap_trigger.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace rotap {

Daemon::Daemon(DaemonConfig config,
               std::unique_ptr<InterfaceProbe> probe,
               std::unique_ptr<ServiceManager> services,
               std::unique_ptr<ClientMonitor> monitor,
               std::unique_ptr<Clock> clock)
    : config_(std::move(config))
    , probe_(std::move(probe))
    , services_(std::move(services))
    , monitor_(std::move(monitor))
    , clock_(std::move(clock))
{
    if (!probe_) probe_ = std::make_unique<InterfaceProbe>();
    if (!services_) services_ = std::make_unique<SystemdServiceManager>();
    if (!monitor_) {
        monitor_ = std::make_unique<IwClientMonitor>(
            std::chrono::milliseconds(config_.client_query_timeout_ms));
    }
    if (!clock_) clock_ = std::make_unique<SystemClock>();
    store_ = std::make_unique<StatusStore>(StatusStore::Options::from_config(config_));
}

Daemon::~Daemon() {
    shutdown();
}

PublishedStatus Daemon::disabled_status(const InterfaceConfig& ic, const std::string& why) const {
    PublishedStatus s;
    s.interface_name = ic.name;
    s.enabled = false;
    s.state = InterfaceState::DISABLED;
    s.security = ic.security;
    s.channel = ic.channel;
    s.health.last_error = why;
    s.health.last_error_at = to_unix_seconds(clock_->now());
    s.updated_at = to_unix_seconds(clock_->now());
    return s;
}

void Daemon::initialize() {
    if (initialized_) return;

    ROTAP_LOG_INFO("AP rotation daemon starting");
    ROTAP_LOG_INFO(std::string("Dual AP mode: ") + (config_.dual_ap_mode ? "on" : "off"));

    if (!store_->prepare()) {
        throw FatalError("cannot create " + config_.run_dir + " or " + config_.log_dir);
    }

    std::string dir_err;
    if (!fs::ensure_directory(config_.hostapd_conf_dir, 0755, &dir_err) ||
        !fs::ensure_directory(config_.dnsmasq_conf_dir, 0755, &dir_err)) {
        throw FatalError("cannot create AP config directory: " + dir_err);
    }

    if (!probe_->exists(config_.wan_interface)) {
        ROTAP_LOG_WARN("WAN interface " + config_.wan_interface +
                       " not present; kiosk clients will have no uplink");
    }

    for (const auto& ic : config_.interfaces) {
        if (!ic.enabled) {
            ROTAP_LOG_INFO("Skipping " + ic.name + " (disabled in config)");
        }
    }

    const auto managed = config_.managed_interfaces();
    for (const auto& ic : config_.interfaces) {
        bool selected = false;
        for (const auto& m : managed) selected = selected || m.name == ic.name;
        if (ic.enabled && !selected) {
            ROTAP_LOG_INFO("Skipping " + ic.name + " (dual_ap_mode disabled)");
        }
    }

    for (const auto& ic : managed) {
        if (!probe_->exists(ic.name)) {
            ROTAP_LOG_WARN("Interface " + ic.name + " not available, skipping");
            PublishedStatus s = disabled_status(ic, "Interface not found");
            store_->publish(s);
            disabled_.push_back(s);
            continue;
        }
        if (!probe_->is_wireless(ic.name)) {
            ROTAP_LOG_WARN("Interface " + ic.name + " does not look wireless; hostapd may refuse it");
        }

        Lane lane;
        lane.config = ic;
        lane.writer = std::make_unique<APConfigWriter>(ApWriterOptions::from_config(config_),
                                                       *services_);

        auto triggers = std::make_unique<TriggerListener>(
            ic.name, *clock_, std::chrono::seconds(config_.manual_rotation_cooldown_sec));
        triggers->add_source(std::make_unique<FileTriggerSource>(
            FileTriggerSource::path_for(config_.run_dir, ic.name)));
        triggers->add_source(std::make_unique<SignalTriggerSource>());

        lane.scheduler = std::make_unique<RotationScheduler>(
            ic, CredentialPolicy::from_config(config_, ic), SchedulerOptions::from_config(config_),
            *clock_, *monitor_, *lane.writer, *store_, std::move(triggers));

        lanes_.push_back(std::move(lane));
        ROTAP_LOG_INFO("Initialized AP instance for " + ic.name);
    }

    if (lanes_.empty()) {
        throw FatalError("No AP interfaces available");
    }

    std::string names;
    for (const auto& l : lanes_) names += (names.empty() ? "" : ", ") + l.config.name;
    ROTAP_LOG_INFO("Active interfaces: " + names);
    initialized_ = true;
}

std::vector<std::string> Daemon::active_interfaces() const {
    std::vector<std::string> names;
    for (const auto& l : lanes_) names.push_back(l.config.name);
    return names;
}

std::vector<PublishedStatus> Daemon::statuses() const {
    std::vector<PublishedStatus> all;
    for (const auto& l : lanes_) all.push_back(l.scheduler->snapshot());
    all.insert(all.end(), disabled_.begin(), disabled_.end());
    return all;
}

void Daemon::publish_aggregate() {
    if (!config_.dual_ap_mode) return;
    store_->publish_aggregate(statuses(), config_.dual_ap_mode, to_unix_seconds(clock_->now()));
}

int Daemon::run(const std::atomic<bool>& running, std::atomic<bool>& reopen_log) {
    if (!initialized_) initialize();

    for (auto& l : lanes_) l.scheduler->start();

    int exit_code = 0;
    const auto period = std::chrono::milliseconds(config_.tick_interval_ms);

    while (running.load()) {
        if (reopen_log.exchange(false)) {
            if (Logger::instance().reopen()) {
                ROTAP_LOG_INFO("Log file reopened");
            } else {
                ROTAP_LOG_ERROR("Failed to reopen log file");
            }
        }

        bool failed = false;
        for (const auto& l : lanes_) {
            if (l.scheduler->has_failed()) {
                ROTAP_LOG_FATAL("[" + l.config.name + "] " + l.scheduler->failure_reason());
                failed = true;
            }
        }
        if (failed) {
            exit_code = 1;
            break;
        }

        publish_aggregate();
        std::this_thread::sleep_for(period);
    }

    ROTAP_LOG_INFO("Shutting down; waiting for in-flight rotations");
    shutdown();
    publish_aggregate();
    ROTAP_LOG_INFO("AP rotation daemon stopped");
    return exit_code;
}

void Daemon::shutdown() {
    for (auto& l : lanes_) {
        if (l.scheduler) l.scheduler->stop();
    }
}

} // namespace rotap
