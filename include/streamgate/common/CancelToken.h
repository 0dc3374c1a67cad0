#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace streamgate {
namespace common {

// Shared between a session (loop thread) and the worker running its
// fetches. Cancel() wakes any sleeping backoff immediately.
class CancelToken {
public:
    void Cancel() {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) return;
            cancelled_ = true;
            callbacks.swap(callbacks_);
        }
        cond_.notify_all();
        for (auto& cb : callbacks) cb();
    }

    bool IsCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // Runs cb once on cancellation, on the cancelling thread; at once if
    // already cancelled.
    void OnCancel(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_) {
                callbacks_.push_back(std::move(cb));
                return;
            }
        }
        cb();
    }

    // Sleeps up to d. Returns true if cancelled before or during the wait.
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cond_.wait_for(lock, d, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cond_;
    bool cancelled_{false};
    std::vector<std::function<void()>> callbacks_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

} // namespace common
} // namespace streamgate
