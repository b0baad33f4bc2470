#ifndef ROTAP_SCHEDULER_HPP
#define ROTAP_SCHEDULER_HPP

#include "rotap_ap_config.hpp"
#include "rotap_client_monitor.hpp"
#include "rotap_clock.hpp"
#include "rotap_config.hpp"
#include "rotap_credentials.hpp"
#include "rotap_status.hpp"
#include "rotap_status_store.hpp"
#include "rotap_trigger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace rotap {

/// Credential of record for one interface. Only its scheduler mutates it.
struct RotationState {
    std::optional<Credential> credential;   // empty until the first confirmed apply
    TimePoint created_at{};                 // wall time, published
    MonoPoint created_mono{};               // steady time, drives the schedule
    std::optional<uint32_t> last_client_count;
    uint64_t sequence = 0;
};

struct SchedulerOptions {
    std::chrono::milliseconds tick_interval{1000};
    std::chrono::seconds retry_delay{5};     // minimum spacing of DEGRADED retries

    static SchedulerOptions from_config(const DaemonConfig& cfg);
};

/**
 * @brief Per-interface rotation state machine
 *
 *   start -> ROTATING -> IDLE -> ROTATING -> IDLE ...
 *                  \                  \
 *                   -> DEGRADED -------+-> (retry) ROTATING
 *
 * Threading model:
 *   - tick() runs either on the caller's thread (tests) or on the worker
 *     started by start(); never both.
 *   - RotationState, phase and health are touched only by the ticking thread.
 *   - snapshot() is the only cross-thread read; it copies the last
 *     published status under snapshot_mu_.
 *   - stop() lets a rotation in progress finish before joining.
 *
 * Collaborators passed by reference must outlive the scheduler. The
 * APConfigWriter must be dedicated to this interface; Clock, ClientMonitor
 * and StatusStore may be shared since they hold no per-interface state.
 */
class RotationScheduler {
public:
    RotationScheduler(InterfaceConfig config,
                      CredentialPolicy policy,
                      SchedulerOptions options,
                      const Clock& clock,
                      ClientMonitor& monitor,
                      APConfigWriter& writer,
                      StatusStore& store,
                      std::unique_ptr<TriggerListener> triggers);
    ~RotationScheduler();

    RotationScheduler(const RotationScheduler&) = delete;
    RotationScheduler& operator=(const RotationScheduler&) = delete;

    /// Evaluate rotation conditions once. Throws FatalError if no
    /// credential can be generated.
    void tick();

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    /// Worker stopped on an unrecoverable error.
    bool has_failed() const { return failed_.load(); }
    std::string failure_reason() const;

    const std::string& interface_name() const { return config_.name; }

    // Ticking thread (or stopped scheduler) only
    InterfaceState state() const { return phase_; }
    const RotationState& rotation_state() const { return state_; }
    const DaemonHealth& health() const { return health_; }

    /// Last published status, safe from any thread.
    PublishedStatus snapshot() const;

private:
    std::optional<RotationReason> due_reason(MonoPoint now,
                                             const std::optional<uint32_t>& clients) const;
    void rotate(RotationReason reason, const std::optional<uint32_t>& clients);
    PublishedStatus build_status(TimePoint now, MonoPoint mono) const;
    void publish();
    void worker_loop();
    std::string tag() const { return "[" + config_.name + "] "; }

    InterfaceConfig config_;
    SchedulerOptions options_;
    const Clock& clock_;
    ClientMonitor& monitor_;
    APConfigWriter& writer_;
    StatusStore& store_;
    CredentialGenerator generator_;
    std::unique_ptr<TriggerListener> triggers_;

    RotationState state_;
    InterfaceState phase_ = InterfaceState::ROTATING;
    bool started_ = false;
    RotationReason pending_reason_ = RotationReason::STARTUP;
    std::optional<MonoPoint> last_failed_attempt_;
    int64_t last_history_time_ = 0;
    std::string last_rotation_reason_;
    DaemonHealth health_;

    mutable std::mutex snapshot_mu_;
    PublishedStatus snapshot_;
    std::string failure_reason_;

    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::thread worker_;
    std::mutex wake_mu_;
    std::condition_variable wake_cv_;
};

} // namespace rotap

#endif // ROTAP_SCHEDULER_HPP
