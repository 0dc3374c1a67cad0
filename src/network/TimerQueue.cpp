#include "streamgate/network/TimerQueue.h"
#include "streamgate/network/Channel.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/common/Logger.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <sys/timerfd.h>
#include <unistd.h>
#include <vector>

namespace streamgate {
namespace network {

namespace {

std::atomic<uint64_t> g_nextTimerId{1};

int CreateTimerfd() {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "timerfd_create failed: " << std::strerror(errno);
    }
    return fd;
}

} // namespace

TimerQueue::TimerQueue(EventLoop* loop)
    : loop_(loop),
      timerfd_(CreateTimerfd()),
      timerfdChannel_(new Channel(loop, timerfd_)) {
    timerfdChannel_->SetReadCallback([this](Timestamp) { HandleRead(); });
    timerfdChannel_->EnableReading();
}

TimerQueue::~TimerQueue() {
    timerfdChannel_->DisableAll();
    timerfdChannel_->Remove();
    ::close(timerfd_);
}

TimerId TimerQueue::AddTimer(TimerCallback cb, Clock::time_point when, Clock::duration interval) {
    const TimerId id = g_nextTimerId.fetch_add(1);
    loop_->RunInLoop([this, id, cb = std::move(cb), when, interval]() mutable {
        AddTimerInLoop(id, std::move(cb), when, interval);
    });
    return id;
}

void TimerQueue::Cancel(TimerId id) {
    loop_->RunInLoop([this, id] { CancelInLoop(id); });
}

void TimerQueue::AddTimerInLoop(TimerId id, TimerCallback cb, Clock::time_point when, Clock::duration interval) {
    timers_.emplace(Key{when, id}, Timer{std::move(cb), interval});
    index_[id] = when;
    if (timers_.begin()->first.second == id) {
        Rearm();
    }
}

void TimerQueue::CancelInLoop(TimerId id) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        timers_.erase(Key{it->second, id});
        index_.erase(it);
    } else if (callingExpired_) {
        cancelledWhileRunning_.insert(id);
    }
}

void TimerQueue::HandleRead() {
    uint64_t howmany = 0;
    ssize_t n = ::read(timerfd_, &howmany, sizeof howmany);
    if (n != sizeof howmany) {
        LOG_DEBUG << "TimerQueue read " << n << " bytes";
    }

    const auto now = Clock::now();
    std::vector<std::pair<TimerId, Timer>> expired;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto it = timers_.begin();
        expired.emplace_back(it->first.second, std::move(it->second));
        index_.erase(it->first.second);
        timers_.erase(it);
    }

    callingExpired_ = true;
    cancelledWhileRunning_.clear();
    for (auto& e : expired) {
        if (cancelledWhileRunning_.count(e.first)) continue;
        e.second.cb();
    }
    callingExpired_ = false;

    for (auto& e : expired) {
        const auto interval = e.second.interval;
        if (interval > Clock::duration::zero() && cancelledWhileRunning_.count(e.first) == 0) {
            const auto when = now + interval;
            timers_.emplace(Key{when, e.first}, Timer{std::move(e.second.cb), interval});
            index_[e.first] = when;
        }
    }
    Rearm();
}

void TimerQueue::Rearm() {
    struct itimerspec spec;
    std::memset(&spec, 0, sizeof spec);
    if (!timers_.empty()) {
        auto delta = timers_.begin()->first.first - Clock::now();
        auto usec = std::chrono::duration_cast<std::chrono::microseconds>(delta).count();
        if (usec < 100) usec = 100;
        spec.it_value.tv_sec = static_cast<time_t>(usec / 1000000);
        spec.it_value.tv_nsec = static_cast<long>((usec % 1000000) * 1000);
    }
    if (::timerfd_settime(timerfd_, 0, &spec, nullptr) != 0) {
        LOG_ERROR << "timerfd_settime failed: " << std::strerror(errno);
    }
}

} // namespace network
} // namespace streamgate
