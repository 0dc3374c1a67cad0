#include "streamgate/limiter/AdmissionController.h"
#include "streamgate/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace streamgate {
namespace limiter {

namespace {

Clock::duration FromSeconds(double sec) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(sec));
}

double ToSeconds(Clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

const char* PriorityClassName(PriorityClass cls) {
    switch (cls) {
        case PriorityClass::kOwner: return "owner";
        case PriorityClass::kAuthorized: return "authorized";
        case PriorityClass::kRegular: return "regular";
    }
    return "unknown";
}

const char* RejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::kNone: return "none";
        case RejectReason::kQueueFull: return "queue_full";
        case RejectReason::kTimeout: return "timeout";
        case RejectReason::kShutdown: return "shutdown";
    }
    return "unknown";
}

AdmissionController::AdmissionController(Config cfg)
    : cfg_(cfg), period_(FromSeconds(cfg.periodMinutes * 60.0)), lastCleanup_(Clock::now()) {
    if (cfg_.enabled) {
        if (cfg_.maxFilesPerPeriod < 1) {
            throw std::invalid_argument("limits: max_files_per_period must be >= 1");
        }
        if (cfg_.periodMinutes <= 0.0) {
            throw std::invalid_argument("limits: period_minutes must be > 0");
        }
        if (cfg_.maxQueueSize < 1) {
            throw std::invalid_argument("limits: max_queue_size must be >= 1");
        }
        if (cfg_.authorizedMultiplier < 1.0) {
            throw std::invalid_argument("limits: authorized_multiplier must be >= 1");
        }
    }
    if (cfg_.maxGlobalRequestsPerMinute > 0) {
        global_.emplace(static_cast<size_t>(cfg_.maxGlobalRequestsPerMinute), std::chrono::minutes(1));
    }
    LOG_INFO << "AdmissionController: enabled=" << cfg_.enabled << " max_files=" << cfg_.maxFilesPerPeriod
             << " period_min=" << cfg_.periodMinutes << " global_per_min=" << cfg_.maxGlobalRequestsPerMinute
             << " max_queue=" << cfg_.maxQueueSize;
}

SlidingWindowCounter& AdmissionController::UserWindowLocked(const std::string& userId, PriorityClass cls) {
    size_t limit = static_cast<size_t>(cfg_.maxFilesPerPeriod);
    if (cls == PriorityClass::kAuthorized) {
        limit = std::max<size_t>(1, static_cast<size_t>(std::floor(cfg_.maxFilesPerPeriod * cfg_.authorizedMultiplier)));
    }
    auto it = users_.find(userId);
    if (it == users_.end()) {
        it = users_.emplace(userId, SlidingWindowCounter(limit, period_)).first;
    } else {
        // The class may change between requests (authorization granted or revoked).
        it->second.set_limit(limit);
    }
    return it->second;
}

bool AdmissionController::HasHeadroomLocked(Clock::time_point now, const std::string& userId, PriorityClass cls) {
    if (global_ && !global_->HasHeadroomAt(now)) return false;
    return UserWindowLocked(userId, cls).HasHeadroomAt(now);
}

void AdmissionController::ConsumeLocked(Clock::time_point now, const std::string& userId, PriorityClass cls) {
    UserWindowLocked(userId, cls).AddAt(now);
    if (global_) global_->AddAt(now);
    stats_.admitted++;
}

double AdmissionController::RetryAfterLocked(Clock::time_point now, const std::string& userId, PriorityClass cls) {
    Clock::duration wait = UserWindowLocked(userId, cls).WaitAt(now);
    if (global_) wait = std::max(wait, global_->WaitAt(now));
    return std::max(1.0, std::ceil(ToSeconds(wait)));
}

AdmissionDecision AdmissionController::Admit(uint64_t requestId, const std::string& userId, PriorityClass cls,
                                             ResolveCallback onResolve) {
    return AdmitAt(Clock::now(), requestId, userId, cls, std::move(onResolve));
}

AdmissionDecision AdmissionController::AdmitAt(Clock::time_point now, uint64_t requestId, const std::string& userId,
                                               PriorityClass cls, ResolveCallback onResolve) {
    AdmissionDecision decision;
    std::vector<Resolution> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            decision.reason = RejectReason::kShutdown;
            return decision;
        }
        if (!cfg_.enabled || cls == PriorityClass::kOwner) {
            stats_.admitted++;
            decision.outcome = AdmissionOutcome::kAdmitted;
            return decision;
        }

        // Earlier queued requests get the headroom first.
        DrainLocked(now, &ready);

        if (HasHeadroomLocked(now, userId, cls)) {
            ConsumeLocked(now, userId, cls);
            decision.outcome = AdmissionOutcome::kAdmitted;
            LOG_DEBUG << "Admission: request " << requestId << " user " << userId << " ("
                      << PriorityClassName(cls) << ") admitted";
        } else {
            auto& queue = queues_[static_cast<size_t>(cls)];
            if (queue.size() >= cfg_.maxQueueSize) {
                stats_.rejectedQueueFull++;
                decision.reason = RejectReason::kQueueFull;
                decision.retryAfterSec = RetryAfterLocked(now, userId, cls);
                LOG_WARN << "Admission: " << PriorityClassName(cls) << " queue full (" << queue.size()
                         << "), rejecting request " << requestId << " user " << userId;
            } else {
                queue.push_back(QueueEntry{requestId, userId, cls, now, std::move(onResolve)});
                stats_.queued++;
                decision.outcome = AdmissionOutcome::kQueued;
                decision.position = queue.size();
                LOG_DEBUG << "Admission: request " << requestId << " user " << userId << " queued at "
                          << decision.position << " in " << PriorityClassName(cls);
            }
        }
    }
    Resolve(ready);
    return decision;
}

bool AdmissionController::Cancel(uint64_t requestId) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& queue : queues_) {
        auto it = std::find_if(queue.begin(), queue.end(),
                               [requestId](const QueueEntry& e) { return e.requestId == requestId; });
        if (it != queue.end()) {
            queue.erase(it);
            stats_.cancelled++;
            return true;
        }
    }
    return false;
}

size_t AdmissionController::Drain() {
    return DrainAt(Clock::now());
}

size_t AdmissionController::DrainAt(Clock::time_point now) {
    std::vector<Resolution> ready;
    size_t admitted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        admitted = DrainLocked(now, &ready);
        if (ToSeconds(now - lastCleanup_) >= cfg_.cleanupIntervalSec) {
            CleanupLocked(now);
            lastCleanup_ = now;
        }
    }
    Resolve(ready);
    return admitted;
}

size_t AdmissionController::DrainLocked(Clock::time_point now, std::vector<Resolution>* out) {
    if (cfg_.queueTimeoutSec > 0.0) {
        const Clock::duration timeout = FromSeconds(cfg_.queueTimeoutSec);
        for (auto& queue : queues_) {
            for (auto it = queue.begin(); it != queue.end();) {
                if (now - it->enqueuedAt >= timeout) {
                    AdmissionDecision d;
                    d.reason = RejectReason::kTimeout;
                    d.retryAfterSec = RetryAfterLocked(now, it->userId, it->cls);
                    LOG_INFO << "Admission: request " << it->requestId << " user " << it->userId
                             << " timed out in " << PriorityClassName(it->cls) << " queue";
                    out->push_back(Resolution{std::move(it->onResolve), d});
                    stats_.rejectedTimeout++;
                    it = queue.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    // Priority order across classes, FIFO within a class. An entry whose
    // user is still over quota keeps its place and does not block others.
    size_t admitted = 0;
    for (auto& queue : queues_) {
        for (auto it = queue.begin(); it != queue.end();) {
            if (global_ && !global_->HasHeadroomAt(now)) return admitted;
            if (!HasHeadroomLocked(now, it->userId, it->cls)) {
                ++it;
                continue;
            }
            ConsumeLocked(now, it->userId, it->cls);
            AdmissionDecision d;
            d.outcome = AdmissionOutcome::kAdmitted;
            LOG_DEBUG << "Admission: queued request " << it->requestId << " user " << it->userId << " admitted";
            out->push_back(Resolution{std::move(it->onResolve), d});
            it = queue.erase(it);
            ++admitted;
        }
    }
    return admitted;
}

void AdmissionController::CleanupLocked(Clock::time_point now) {
    std::set<std::string> waiting;
    for (const auto& queue : queues_) {
        for (const auto& e : queue) waiting.insert(e.userId);
    }
    const size_t before = users_.size();
    for (auto it = users_.begin(); it != users_.end();) {
        if (it->second.EmptyAt(now) && waiting.count(it->first) == 0) {
            it = users_.erase(it);
        } else {
            ++it;
        }
    }
    if (before != users_.size()) {
        LOG_DEBUG << "Admission: dropped " << (before - users_.size()) << "/" << before << " inactive users";
    }
}

void AdmissionController::Shutdown() {
    std::vector<Resolution> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        for (auto& queue : queues_) {
            for (auto& e : queue) {
                AdmissionDecision d;
                d.reason = RejectReason::kShutdown;
                ready.push_back(Resolution{std::move(e.onResolve), d});
            }
            queue.clear();
        }
    }
    Resolve(ready);
}

void AdmissionController::ResetUsage(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (userId.empty()) {
        users_.clear();
        if (global_) {
            global_.emplace(global_->limit(), global_->window());
        }
    } else {
        users_.erase(userId);
    }
}

AdmissionController::Stats AdmissionController::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s = stats_;
    for (size_t i = 0; i < queues_.size(); ++i) s.queueDepth[i] = queues_[i].size();
    s.trackedUsers = users_.size();
    return s;
}

size_t AdmissionController::QueueDepth(PriorityClass cls) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_[static_cast<size_t>(cls)].size();
}

void AdmissionController::Resolve(std::vector<Resolution>& resolutions) {
    for (auto& r : resolutions) {
        if (r.cb) r.cb(r.decision);
    }
}

} // namespace limiter
} // namespace streamgate
