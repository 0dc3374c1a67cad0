#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "streamgate/common/noncopyable.h"

namespace streamgate {
namespace common {

// Fixed set of threads for blocking upstream work. I/O loops hand tasks
// here and receive results back through EventLoop::RunInLoop.
class WorkerPool : noncopyable {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t numThreads, std::string name = "worker");
    ~WorkerPool();

    // Returns false once Stop() has been called; the task is dropped.
    bool Submit(Task task);

    // Finishes queued tasks, then joins. Idempotent.
    void Stop();

    size_t PendingTasks() const;
    size_t ThreadCount() const { return threads_.size(); }

private:
    void WorkerLoop();

    std::string name_;
    std::vector<std::thread> threads_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Task> tasks_;
    bool stopping_{false};
};

} // namespace common
} // namespace streamgate
