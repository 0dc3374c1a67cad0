#include "streamgate/network/EventLoopThread.h"
#include "streamgate/network/EventLoop.h"

namespace streamgate {
namespace network {

EventLoopThread::EventLoopThread(std::string name)
    : loop_(nullptr),
      name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() {
    EventLoop* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_;
    }
    if (loop != nullptr) {
        loop->Quit();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread([this] { ThreadFunc(); });

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::ThreadFunc() {
    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
    }
    cond_.notify_one();

    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, std::string name)
    : baseLoop_(baseLoop),
      name_(std::move(name)),
      started_(false),
      numThreads_(0),
      next_(0) {}

EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start() {
    started_ = true;
    for (int i = 0; i < numThreads_; ++i) {
        threads_.push_back(std::make_unique<EventLoopThread>(name_ + "-io" + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) return baseLoop_;
    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}

std::vector<EventLoop*> EventLoopThreadPool::GetAllLoops() const {
    if (loops_.empty()) return {baseLoop_};
    return loops_;
}

} // namespace network
} // namespace streamgate
