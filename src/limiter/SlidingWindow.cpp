#include "streamgate/limiter/SlidingWindow.h"

namespace streamgate {
namespace limiter {

void SlidingWindowCounter::Expire(Clock::time_point now) {
    while (!events_.empty() && now - events_.front() >= window_) {
        events_.pop_front();
    }
}

size_t SlidingWindowCounter::CountAt(Clock::time_point now) {
    Expire(now);
    return events_.size();
}

void SlidingWindowCounter::AddAt(Clock::time_point now) {
    Expire(now);
    events_.push_back(now);
}

Clock::duration SlidingWindowCounter::WaitAt(Clock::time_point now) {
    Expire(now);
    if (events_.size() < limit_) return Clock::duration::zero();
    if (limit_ == 0) return window_;
    // The event that has to age out before one more fits.
    const Clock::time_point blocking = events_[events_.size() - limit_];
    return blocking + window_ - now;
}

} // namespace limiter
} // namespace streamgate
