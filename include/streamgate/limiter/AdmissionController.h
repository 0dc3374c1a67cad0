#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/limiter/SlidingWindow.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace streamgate {
namespace limiter {

// Highest precedence first.
enum class PriorityClass { kOwner = 0, kAuthorized = 1, kRegular = 2 };

const char* PriorityClassName(PriorityClass cls);

enum class AdmissionOutcome { kAdmitted, kQueued, kRejected };

enum class RejectReason { kNone, kQueueFull, kTimeout, kShutdown };

const char* RejectReasonName(RejectReason reason);

struct AdmissionDecision {
    AdmissionOutcome outcome{AdmissionOutcome::kRejected};
    size_t position{0};           // 1 based, within the class queue, when queued
    RejectReason reason{RejectReason::kNone};
    double retryAfterSec{0.0};    // hint for rejected requests

    bool admitted() const { return outcome == AdmissionOutcome::kAdmitted; }
    bool queued() const { return outcome == AdmissionOutcome::kQueued; }
};

// Decides per request whether it is served now, parked in its class queue,
// or turned away, using per-user and global sliding windows. Thread safe;
// callbacks always run without the internal lock held.
class AdmissionController : streamgate::common::noncopyable {
public:
    struct Config {
        bool enabled{true};
        int maxFilesPerPeriod{5};
        double periodMinutes{1.0};
        int maxGlobalRequestsPerMinute{0};    // <=0 disables the global window
        size_t maxQueueSize{100};             // per class
        double authorizedMultiplier{2.0};
        double queueTimeoutSec{120.0};        // <=0 waits forever
        double cleanupIntervalSec{300.0};
    };

    struct Stats {
        uint64_t admitted{0};
        uint64_t queued{0};
        uint64_t rejectedQueueFull{0};
        uint64_t rejectedTimeout{0};
        uint64_t cancelled{0};
        std::array<size_t, 3> queueDepth{{0, 0, 0}};
        size_t trackedUsers{0};
    };

    // Resolves a queued request: admitted, or rejected on timeout/shutdown.
    using ResolveCallback = std::function<void(const AdmissionDecision&)>;

    // Throws std::invalid_argument for unusable limits.
    explicit AdmissionController(Config cfg);

    // onResolve is kept only when the request is queued.
    AdmissionDecision Admit(uint64_t requestId, const std::string& userId, PriorityClass cls,
                            ResolveCallback onResolve);
    AdmissionDecision AdmitAt(Clock::time_point now, uint64_t requestId, const std::string& userId,
                              PriorityClass cls, ResolveCallback onResolve);

    // Removes a parked request without touching any counter. False if it
    // was not queued (already admitted, rejected or unknown).
    bool Cancel(uint64_t requestId);

    // Expires timed out entries and admits queued ones while headroom lasts.
    // Returns the number admitted.
    size_t Drain();
    size_t DrainAt(Clock::time_point now);

    // Rejects everything still queued.
    void Shutdown();

    // Forgets the usage of one user, or of everyone when userId is empty.
    void ResetUsage(const std::string& userId = std::string());

    Stats GetStats() const;
    size_t QueueDepth(PriorityClass cls) const;
    const Config& config() const { return cfg_; }

private:
    struct QueueEntry {
        uint64_t requestId;
        std::string userId;
        PriorityClass cls;
        Clock::time_point enqueuedAt;
        ResolveCallback onResolve;
    };

    struct Resolution {
        ResolveCallback cb;
        AdmissionDecision decision;
    };

    SlidingWindowCounter& UserWindowLocked(const std::string& userId, PriorityClass cls);
    bool HasHeadroomLocked(Clock::time_point now, const std::string& userId, PriorityClass cls);
    void ConsumeLocked(Clock::time_point now, const std::string& userId, PriorityClass cls);
    double RetryAfterLocked(Clock::time_point now, const std::string& userId, PriorityClass cls);
    size_t DrainLocked(Clock::time_point now, std::vector<Resolution>* out);
    void CleanupLocked(Clock::time_point now);
    static void Resolve(std::vector<Resolution>& resolutions);

    const Config cfg_;
    const Clock::duration period_;

    mutable std::mutex mutex_;
    std::map<std::string, SlidingWindowCounter> users_;
    std::optional<SlidingWindowCounter> global_;
    std::array<std::deque<QueueEntry>, 3> queues_;
    Clock::time_point lastCleanup_;
    bool shutdown_{false};
    Stats stats_;
};

} // namespace limiter
} // namespace streamgate
