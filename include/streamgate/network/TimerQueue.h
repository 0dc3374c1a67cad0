#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/network/Callbacks.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <unordered_map>
#include <utility>

namespace streamgate {
namespace network {

class Channel;
class EventLoop;

using TimerId = uint64_t;

// One timerfd per loop, armed for the earliest pending timer.
// All members except AddTimer/Cancel must run in the owner loop.
class TimerQueue : streamgate::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    explicit TimerQueue(EventLoop* loop);
    ~TimerQueue();

    // interval of zero means one-shot. Thread safe.
    TimerId AddTimer(TimerCallback cb, Clock::time_point when, Clock::duration interval);
    // Thread safe; a no-op for fired or unknown ids.
    void Cancel(TimerId id);

    size_t Size() const { return timers_.size(); }

private:
    struct Timer {
        TimerCallback cb;
        Clock::duration interval;
    };
    using Key = std::pair<Clock::time_point, TimerId>;

    void AddTimerInLoop(TimerId id, TimerCallback cb, Clock::time_point when, Clock::duration interval);
    void CancelInLoop(TimerId id);
    void HandleRead();
    void Rearm();

    EventLoop* loop_;
    const int timerfd_;
    std::unique_ptr<Channel> timerfdChannel_;

    std::map<Key, Timer> timers_;
    std::unordered_map<TimerId, Clock::time_point> index_;
    std::set<TimerId> cancelledWhileRunning_;
    bool callingExpired_{false};
};

} // namespace network
} // namespace streamgate
