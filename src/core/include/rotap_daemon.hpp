#ifndef ROTAP_DAEMON_HPP
#define ROTAP_DAEMON_HPP

#include "rotap_ap_config.hpp"
#include "rotap_client_monitor.hpp"
#include "rotap_clock.hpp"
#include "rotap_config.hpp"
#include "rotap_interfaces.hpp"
#include "rotap_scheduler.hpp"
#include "rotap_service_manager.hpp"
#include "rotap_status_store.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace rotap {

/**
 * @brief Wires one RotationScheduler per managed interface
 *
 * Owns every collaborator. Interfaces run on independent workers; the
 * daemon thread only publishes the aggregate view and watches for
 * shutdown requests and failed workers.
 */
class Daemon {
public:
    /// Null collaborators are replaced by the production implementations.
    explicit Daemon(DaemonConfig config,
                    std::unique_ptr<InterfaceProbe> probe = nullptr,
                    std::unique_ptr<ServiceManager> services = nullptr,
                    std::unique_ptr<ClientMonitor> monitor = nullptr,
                    std::unique_ptr<Clock> clock = nullptr);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /// Prepare directories and schedulers. Throws FatalError when no
    /// configured interface is usable or state directories cannot be created.
    void initialize();

    /**
     * @brief Run until running becomes false or a worker fails.
     * @param reopen_log set by SIGHUP; cleared once the log is reopened
     * @return process exit code
     */
    int run(const std::atomic<bool>& running, std::atomic<bool>& reopen_log);

    void shutdown();

    std::vector<std::string> active_interfaces() const;
    std::vector<PublishedStatus> statuses() const;

private:
    struct Lane {
        InterfaceConfig config;
        std::unique_ptr<APConfigWriter> writer;
        std::unique_ptr<RotationScheduler> scheduler;
    };

    PublishedStatus disabled_status(const InterfaceConfig& ic, const std::string& why) const;
    void publish_aggregate();

    DaemonConfig config_;
    std::unique_ptr<InterfaceProbe> probe_;
    std::unique_ptr<ServiceManager> services_;
    std::unique_ptr<ClientMonitor> monitor_;
    std::unique_ptr<Clock> clock_;
    std::unique_ptr<StatusStore> store_;

    std::vector<Lane> lanes_;
    std::vector<PublishedStatus> disabled_;
    bool initialized_ = false;
};

} // namespace rotap

#endif // ROTAP_DAEMON_HPP
