#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "streamgate/common/noncopyable.h"
#include "streamgate/network/Callbacks.h"
#include "streamgate/network/TimerQueue.h"

namespace streamgate {
namespace network {

class Channel;
class Poller;

// One loop per thread. Everything touching a connection happens in its loop;
// other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : streamgate::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    TimerId RunAfter(double delaySec, TimerCallback cb);
    TimerId RunEvery(double intervalSec, TimerCallback cb);
    void CancelTimer(TimerId id);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void HandleWakeup();
    void DoPendingFunctors();

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<Poller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;
    std::unique_ptr<TimerQueue> timers_;

    std::vector<Channel*> active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace streamgate
