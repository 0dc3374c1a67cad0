#include "streamgate/network/EventLoop.h"
#include "streamgate/network/Channel.h"
#include "streamgate/network/Poller.h"
#include "streamgate/common/Logger.h"

#include <csignal>
#include <sys/eventfd.h>
#include <unistd.h>

namespace streamgate {
namespace network {

namespace {

thread_local EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

// SSL_write still goes through write(2); a vanished peer must not kill the process.
struct IgnoreSigPipe {
    IgnoreSigPipe() { ::signal(SIGPIPE, SIG_IGN); }
};
IgnoreSigPipe g_ignoreSigPipe;

int CreateEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL << "Failed in eventfd";
    }
    return evtfd;
}

std::chrono::steady_clock::duration SecondsToDuration(double sec) {
    if (sec < 0.0) sec = 0.0;
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(sec));
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new Poller(this)),
      wakeup_fd_(CreateEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)) {
    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in this thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_->SetReadCallback([this](Timestamp) { HandleWakeup(); });
    wakeup_channel_->EnableReading();
    timers_.reset(new TimerQueue(this));
}

EventLoop::~EventLoop() {
    timers_.reset();
    wakeup_channel_->DisableAll();
    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    looping_ = true;
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " start looping";

    while (!quit_) {
        active_channels_.clear();
        Timestamp receiveTime = poller_->Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(receiveTime);
        }
        DoPendingFunctors();
    }

    LOG_DEBUG << "EventLoop " << this << " stop looping";
    looping_ = false;
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }

    if (!IsInLoopThread() || calling_pending_functors_) {
        WakeUp();
    }
}

TimerId EventLoop::RunAfter(double delaySec, TimerCallback cb) {
    return timers_->AddTimer(std::move(cb), TimerQueue::Clock::now() + SecondsToDuration(delaySec),
                             TimerQueue::Clock::duration::zero());
}

TimerId EventLoop::RunEvery(double intervalSec, TimerCallback cb) {
    auto interval = SecondsToDuration(intervalSec);
    if (interval <= TimerQueue::Clock::duration::zero()) interval = std::chrono::milliseconds(1);
    return timers_->AddTimer(std::move(cb), TimerQueue::Clock::now() + interval, interval);
}

void EventLoop::CancelTimer(TimerId id) {
    timers_->Cancel(id);
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::WakeUp() writes " << n << " bytes instead of 8";
    }
}

void EventLoop::HandleWakeup() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::HandleWakeup() reads " << n << " bytes instead of 8";
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) {
    return poller_->HasChannel(channel);
}

void EventLoop::DoPendingFunctors() {
    std::vector<Functor> functors;
    calling_pending_functors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }

    for (const auto& functor : functors) {
        functor();
    }
    calling_pending_functors_ = false;
}

} // namespace network
} // namespace streamgate
