#ifndef ROTAP_TRIGGER_HPP
#define ROTAP_TRIGGER_HPP

#include "rotap_clock.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rotap {

/**
 * @brief One backend of manual rotation requests
 *
 * poll() returns true at most once per event and clears it.
 */
class TriggerSource {
public:
    virtual ~TriggerSource() = default;
    virtual bool poll() = 0;
    virtual std::string describe() const = 0;
};

/// Sentinel file created by an external process; consumed by unlink().
class FileTriggerSource : public TriggerSource {
public:
    explicit FileTriggerSource(std::string path);

    bool poll() override;
    std::string describe() const override { return "file " + path_; }

    /// <run_dir>/trigger-rotate-<iface>
    static std::string path_for(const std::string& run_dir, const std::string& interface_name);

private:
    std::string path_;
    bool warned_ = false;
};

/**
 * @brief Hardware button relayed by the status indicator as SIGUSR1
 *
 * notify() is async-signal-safe and bumps a process-wide counter. Each
 * source fires once per change of the counter, so presses between two
 * polls collapse into one event and every interface sees the press.
 */
class SignalTriggerSource : public TriggerSource {
public:
    SignalTriggerSource();

    bool poll() override;
    std::string describe() const override { return "button relay (SIGUSR1)"; }

    static void notify() noexcept;

private:
    static std::atomic<uint32_t> events_;
    uint32_t seen_;
};

/**
 * @brief Rate-limited manual trigger for one interface
 *
 * consume() drains every source on each call, so a request rejected by
 * the cooldown is dropped rather than fired late.
 */
class TriggerListener {
public:
    TriggerListener(std::string interface_name, const Clock& clock, std::chrono::seconds cooldown);

    void add_source(std::unique_ptr<TriggerSource> source);

    bool consume();

    /// Drain pending events without accepting them (startup rotation covers them).
    void discard();

    size_t source_count() const { return sources_.size(); }

private:
    std::string interface_name_;
    const Clock& clock_;
    std::chrono::seconds cooldown_;
    std::vector<std::unique_ptr<TriggerSource>> sources_;
    std::optional<MonoPoint> last_accepted_;
};

} // namespace rotap

#endif // ROTAP_TRIGGER_HPP
