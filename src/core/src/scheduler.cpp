/**
 * @file scheduler.cpp
 * @brief Per-interface rotation state machine
 *
 * Tick order (first match wins):
 *   0. first tick: discard leftover triggers, rotate with reason startup
 *   1. manual trigger accepted by the listener
 *   2. DEGRADED: retry the pending reason once retry_delay has passed
 *   3. age >= rotation_interval_sec
 *   4. clients >= client_threshold and age >= min_time_after_clients_sec
 *      (unknown client count never satisfies this)
 *   5. otherwise republish status with a fresh countdown
 */

#include "../include/rotap_scheduler.hpp"
#include "../include/rotap_errors.hpp"
#include "../include/rotap_logger.hpp"

#include <algorithm>
#include <utility>

namespace rotap {

SchedulerOptions SchedulerOptions::from_config(const DaemonConfig& cfg) {
    SchedulerOptions o;
    o.tick_interval = std::chrono::milliseconds(cfg.tick_interval_ms);
    o.retry_delay = std::chrono::seconds(cfg.apply_retry_delay_sec);
    return o;
}

RotationScheduler::RotationScheduler(InterfaceConfig config,
                                     CredentialPolicy policy,
                                     SchedulerOptions options,
                                     const Clock& clock,
                                     ClientMonitor& monitor,
                                     APConfigWriter& writer,
                                     StatusStore& store,
                                     std::unique_ptr<TriggerListener> triggers)
    : config_(std::move(config))
    , options_(options)
    , clock_(clock)
    , monitor_(monitor)
    , writer_(writer)
    , store_(store)
    , generator_(policy)
    , triggers_(std::move(triggers))
{
    snapshot_ = build_status(clock_.now(), clock_.steady_now());
}

RotationScheduler::~RotationScheduler() {
    stop();
}

// ==================== State machine ====================

std::optional<RotationReason> RotationScheduler::due_reason(
    MonoPoint now, const std::optional<uint32_t>& clients) const
{
    const auto age = now - state_.created_mono;

    if (age >= Seconds(config_.rotation_interval_sec)) {
        return RotationReason::TIME_ELAPSED;
    }
    if (clients && *clients >= config_.client_threshold &&
        age >= Seconds(config_.min_time_after_clients_sec)) {
        return RotationReason::CLIENT_THRESHOLD;
    }
    return std::nullopt;
}

void RotationScheduler::tick() {
    const MonoPoint now = clock_.steady_now();
    const std::optional<uint32_t> clients = monitor_.count(config_.name);
    state_.last_client_count = clients;

    if (!started_) {
        started_ = true;
        if (triggers_) triggers_->discard();
        rotate(RotationReason::STARTUP, clients);
        return;
    }

    if (triggers_ && triggers_->consume()) {
        rotate(RotationReason::MANUAL_TRIGGER, clients);
        return;
    }

    if (phase_ == InterfaceState::DEGRADED) {
        if (!last_failed_attempt_ || now - *last_failed_attempt_ >= options_.retry_delay) {
            ROTAP_LOG_INFO(tag() + "Retrying rotation (" +
                           rotation_reason_name(pending_reason_) + ")");
            rotate(pending_reason_, clients);
        } else {
            publish();
        }
        return;
    }

    if (auto reason = due_reason(now, clients)) {
        if (*reason == RotationReason::CLIENT_THRESHOLD) {
            ROTAP_LOG_INFO(tag() + "Client threshold reached (clients=" +
                           std::to_string(*clients) + ")");
        }
        rotate(*reason, clients);
        return;
    }

    publish();
}

void RotationScheduler::rotate(RotationReason reason, const std::optional<uint32_t>& clients) {
    const char* reason_name = rotation_reason_name(reason);
    ROTAP_LOG_INFO(tag() + "Starting rotation: " + reason_name);

    phase_ = InterfaceState::ROTATING;
    publish();

    Credential cred = generator_.generate(config_.ssid_prefix);
    ApplyResult result = writer_.apply(config_.name, cred, config_);
    const TimePoint now = clock_.now();
    const MonoPoint mono = clock_.steady_now();

    if (!result.ok) {
        // Credential of record and created_at stay as they were
        phase_ = InterfaceState::DEGRADED;
        pending_reason_ = reason;
        last_failed_attempt_ = mono;
        health_.last_error = result.error;
        health_.last_error_at = to_unix_seconds(now);
        health_.consecutive_failures++;
        ROTAP_LOG_ERROR(tag() + "Rotation failed (" + reason_name + "): " + result.error +
                        "; serving previous credential, attempt " +
                        std::to_string(health_.consecutive_failures));
        publish();
        return;
    }

    std::optional<std::string> prior_hash;
    if (state_.credential) prior_hash = redact_ssid(state_.credential->ssid);

    state_.credential = std::move(cred);
    state_.created_at = now;
    state_.created_mono = mono;
    state_.sequence++;

    health_.last_success_at = to_unix_seconds(now);
    health_.last_error.clear();
    health_.last_error_at.reset();
    health_.consecutive_failures = 0;

    last_rotation_reason_ = reason_name;
    last_failed_attempt_.reset();
    phase_ = InterfaceState::IDLE;
    publish();

    // History stays ordered per interface across a backward wall-clock step
    last_history_time_ = std::max(last_history_time_, to_unix_seconds(now));

    RotationHistoryEntry entry;
    entry.time = last_history_time_;
    entry.interface_name = config_.name;
    entry.reason = reason;
    entry.sequence = state_.sequence;
    entry.prior_ssid_hash = prior_hash;
    entry.client_count = clients;
    if (!store_.append_history(entry)) {
        ROTAP_LOG_WARN(tag() + "Rotation #" + std::to_string(state_.sequence) +
                       " active but not recorded in history");
    }

    ROTAP_LOG_INFO(tag() + "Rotation #" + std::to_string(state_.sequence) +
                   " complete: SSID=" + state_.credential->ssid);
}

// ==================== Publishing ====================

PublishedStatus RotationScheduler::build_status(TimePoint now, MonoPoint mono) const {
    PublishedStatus s;
    s.interface_name = config_.name;
    s.enabled = config_.enabled;
    s.state = phase_;
    s.security = config_.security;
    s.channel = config_.channel;
    s.sequence = state_.sequence;
    s.client_count = state_.last_client_count;
    s.last_rotation_reason = last_rotation_reason_;
    s.health = health_;
    s.updated_at = to_unix_seconds(now);

    if (state_.credential) {
        s.ssid = state_.credential->ssid;
        s.passphrase = state_.credential->passphrase;
        s.created_at = to_unix_seconds(state_.created_at);
        const auto due = state_.created_mono + Seconds(config_.rotation_interval_sec);
        int64_t left = std::chrono::duration_cast<Seconds>(due - mono).count();
        if (left < 0) left = 0;
        s.seconds_until_next = left;
        s.expires_at = to_unix_seconds(now) + left;
    }
    return s;
}

void RotationScheduler::publish() {
    PublishedStatus s = build_status(clock_.now(), clock_.steady_now());
    {
        std::lock_guard<std::mutex> lock(snapshot_mu_);
        snapshot_ = s;
    }
    store_.publish(s);
}

PublishedStatus RotationScheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mu_);
    return snapshot_;
}

std::string RotationScheduler::failure_reason() const {
    std::lock_guard<std::mutex> lock(snapshot_mu_);
    return failure_reason_;
}

// ==================== Worker ====================

void RotationScheduler::start() {
    if (running_.load()) return;
    running_ = true;
    worker_ = std::thread(&RotationScheduler::worker_loop, this);
}

void RotationScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mu_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void RotationScheduler::worker_loop() {
    ROTAP_LOG_INFO(tag() + "Scheduler started (interval=" +
                   std::to_string(config_.rotation_interval_sec) + "s, threshold=" +
                   std::to_string(config_.client_threshold) + " clients after " +
                   std::to_string(config_.min_time_after_clients_sec) + "s)");

    while (running_.load()) {
        const auto next_tick = std::chrono::steady_clock::now() + options_.tick_interval;
        try {
            tick();
        } catch (const std::exception& e) {
            ROTAP_LOG_FATAL(tag() + "Scheduler halted: " + e.what());
            {
                std::lock_guard<std::mutex> lock(snapshot_mu_);
                failure_reason_ = e.what();
            }
            failed_ = true;
            running_ = false;
            break;
        }

        std::unique_lock<std::mutex> lock(wake_mu_);
        wake_cv_.wait_until(lock, next_tick, [this] { return !running_.load(); });
    }

    ROTAP_LOG_INFO(tag() + "Scheduler stopped");
}

} // namespace rotap
