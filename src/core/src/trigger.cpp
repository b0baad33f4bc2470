#include "../include/rotap_trigger.hpp"
#include "../include/rotap_fs.hpp"
#include "../include/rotap_logger.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <unistd.h>

namespace rotap {

static_assert(std::atomic<uint32_t>::is_always_lock_free,
              "signal handler needs a lock-free counter");

// ==================== FileTriggerSource ====================

FileTriggerSource::FileTriggerSource(std::string path)
    : path_(std::move(path))
{}

std::string FileTriggerSource::path_for(const std::string& run_dir,
                                        const std::string& interface_name) {
    return fs::join(run_dir, "trigger-rotate-" + interface_name);
}

bool FileTriggerSource::poll() {
    // unlink() succeeds for exactly one caller: that is the consumption
    if (::unlink(path_.c_str()) == 0) {
        warned_ = false;
        return true;
    }
    if (errno != ENOENT && !warned_) {
        ROTAP_LOG_WARN("Manual trigger unavailable at " + path_ + ": " + std::strerror(errno));
        warned_ = true;
    }
    return false;
}

// ==================== SignalTriggerSource ====================

std::atomic<uint32_t> SignalTriggerSource::events_{0};

SignalTriggerSource::SignalTriggerSource()
    : seen_(events_.load())
{}

void SignalTriggerSource::notify() noexcept {
    events_.fetch_add(1, std::memory_order_relaxed);
}

bool SignalTriggerSource::poll() {
    uint32_t current = events_.load();
    if (current == seen_) return false;
    seen_ = current;
    return true;
}

// ==================== TriggerListener ====================

TriggerListener::TriggerListener(std::string interface_name, const Clock& clock,
                                 std::chrono::seconds cooldown)
    : interface_name_(std::move(interface_name))
    , clock_(clock)
    , cooldown_(cooldown)
{}

void TriggerListener::add_source(std::unique_ptr<TriggerSource> source) {
    sources_.push_back(std::move(source));
}

bool TriggerListener::consume() {
    std::string fired_by;
    for (auto& src : sources_) {
        if (src->poll() && fired_by.empty()) fired_by = src->describe();
    }
    if (fired_by.empty()) return false;

    const MonoPoint now = clock_.steady_now();
    if (last_accepted_ && now - *last_accepted_ < cooldown_) {
        auto remaining = std::chrono::duration_cast<Seconds>(
            cooldown_ - (now - *last_accepted_)).count();
        ROTAP_LOG_WARN("[" + interface_name_ + "] Manual rotation cooldown: " +
                       std::to_string(remaining) + "s remaining, ignoring " + fired_by);
        return false;
    }

    last_accepted_ = now;
    ROTAP_LOG_INFO("[" + interface_name_ + "] Manual rotation requested via " + fired_by);
    return true;
}

void TriggerListener::discard() {
    for (auto& src : sources_) {
        if (src->poll()) {
            ROTAP_LOG_DEBUG("[" + interface_name_ + "] Discarded pending " + src->describe());
        }
    }
}

} // namespace rotap
