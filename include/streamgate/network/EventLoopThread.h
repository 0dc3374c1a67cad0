#pragma once

#include "streamgate/common/noncopyable.h"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace streamgate {
namespace network {

class EventLoop;

// Runs an EventLoop on its own thread; the loop lives on that thread's stack.
class EventLoopThread : streamgate::common::noncopyable {
public:
    explicit EventLoopThread(std::string name = std::string());
    ~EventLoopThread();

    // Blocks until the loop is constructed and returns it.
    EventLoop* StartLoop();
    const std::string& name() const { return name_; }

private:
    void ThreadFunc();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

// I/O loops handed out round-robin. With zero threads everything runs on the base loop.
class EventLoopThreadPool : streamgate::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, std::string name);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    EventLoop* GetNextLoop();
    std::vector<EventLoop*> GetAllLoops() const;

    bool started() const { return started_; }

private:
    EventLoop* baseLoop_;
    std::string name_;
    bool started_;
    int numThreads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace streamgate
