#include "streamgate/common/WorkerPool.h"
#include "streamgate/common/Logger.h"

#include <exception>

namespace streamgate {
namespace common {

WorkerPool::WorkerPool(size_t numThreads, std::string name)
    : name_(std::move(name)) {
    if (numThreads == 0) numThreads = 1;
    threads_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        threads_.emplace_back([this] { WorkerLoop(); });
    }
    LOG_INFO << "WorkerPool " << name_ << " started with " << numThreads << " threads";
}

WorkerPool::~WorkerPool() {
    Stop();
}

bool WorkerPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        tasks_.push_back(std::move(task));
    }
    cond_.notify_one();
    return true;
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cond_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

size_t WorkerPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::WorkerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR << "WorkerPool " << name_ << " task threw: " << e.what();
        }
    }
}

} // namespace common
} // namespace streamgate
