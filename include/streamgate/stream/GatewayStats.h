#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace streamgate {
namespace stream {

// Process counters shown on /status. One instance per gateway.
class GatewayStats {
public:
    GatewayStats() : startTime_(std::chrono::steady_clock::now()) {}

    void IncRequests() { requests_.fetch_add(1, std::memory_order_relaxed); }
    void AddBytesServed(uint64_t n) { bytesServed_.fetch_add(n, std::memory_order_relaxed); }
    void IncCompleted() { completed_.fetch_add(1, std::memory_order_relaxed); }
    void IncFailed() { failed_.fetch_add(1, std::memory_order_relaxed); }
    void IncCancelled() { cancelled_.fetch_add(1, std::memory_order_relaxed); }
    void IncThrottled() { throttled_.fetch_add(1, std::memory_order_relaxed); }
    void IncReacquired() { reacquired_.fetch_add(1, std::memory_order_relaxed); }
    void SessionStarted() { activeSessions_.fetch_add(1, std::memory_order_relaxed); }
    void SessionEnded() { activeSessions_.fetch_sub(1, std::memory_order_relaxed); }

    uint64_t requests() const { return requests_.load(std::memory_order_relaxed); }
    uint64_t bytesServed() const { return bytesServed_.load(std::memory_order_relaxed); }
    uint64_t completed() const { return completed_.load(std::memory_order_relaxed); }
    uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }
    uint64_t cancelled() const { return cancelled_.load(std::memory_order_relaxed); }
    uint64_t throttled() const { return throttled_.load(std::memory_order_relaxed); }
    uint64_t reacquired() const { return reacquired_.load(std::memory_order_relaxed); }
    int64_t activeSessions() const { return activeSessions_.load(std::memory_order_relaxed); }

    double UptimeSec() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count();
    }

private:
    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> bytesServed_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> throttled_{0};
    std::atomic<uint64_t> reacquired_{0};
    std::atomic<int64_t> activeSessions_{0};
    const std::chrono::steady_clock::time_point startTime_;
};

} // namespace stream
} // namespace streamgate
