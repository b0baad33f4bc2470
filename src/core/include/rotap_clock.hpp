#ifndef ROTAP_CLOCK_HPP
#define ROTAP_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace rotap {

using TimePoint  = std::chrono::system_clock::time_point;
using MonoPoint  = std::chrono::steady_clock::time_point;
using Seconds    = std::chrono::seconds;

/**
 * @brief Time source seam
 *
 * Schedulers read time only through this interface so tests can
 * step through a five minute rotation cycle without sleeping.
 *
 * now() is wall time for published and recorded timestamps. Elapsed
 * time (rotation age, retry spacing, cooldowns) is measured on
 * steady_now(), which NTP or fake-hwclock corrections do not move.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
    virtual MonoPoint steady_now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
    MonoPoint steady_now() const override { return std::chrono::steady_clock::now(); }
};

inline int64_t to_unix_seconds(TimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

inline int64_t seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Seconds>(to - from).count();
}

} // namespace rotap

#endif // ROTAP_CLOCK_HPP
