#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace streamgate {
namespace limiter {

using Clock = std::chrono::steady_clock;

// Counts events in the trailing window. Stale events are dropped lazily
// on every access, so no timer is needed. Not thread safe; the owner locks.
class SlidingWindowCounter {
public:
    SlidingWindowCounter(size_t limit, Clock::duration window)
        : limit_(limit), window_(window) {}

    size_t CountAt(Clock::time_point now);
    bool HasHeadroomAt(Clock::time_point now) { return CountAt(now) < limit_; }
    void AddAt(Clock::time_point now);
    // Time until one more event fits; zero when it already does.
    Clock::duration WaitAt(Clock::time_point now);
    bool EmptyAt(Clock::time_point now) { return CountAt(now) == 0; }

    size_t limit() const { return limit_; }
    void set_limit(size_t limit) { limit_ = limit; }
    Clock::duration window() const { return window_; }

private:
    void Expire(Clock::time_point now);

    size_t limit_;
    Clock::duration window_;
    std::deque<Clock::time_point> events_;
};

} // namespace limiter
} // namespace streamgate
