#pragma once

#include "streamgate/common/CancelToken.h"
#include "streamgate/common/noncopyable.h"
#include "streamgate/upstream/UpstreamClient.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace streamgate {
namespace stream {

// fileRef -> FileMeta, bounded by entry count (LRU) and age (TTL).
// Failed loads are never cached. Thread safe.
class MetadataCache : streamgate::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;
    using Waiter = std::function<void(const upstream::MetaResult&)>;
    // Reports the outcome of a load. Any thread; only the first call counts.
    using Completion = std::function<void(const upstream::MetaResult&)>;
    // Starts loading fileRef without blocking and eventually calls complete.
    // cancel fires once every waiter has left.
    using Loader = std::function<void(const std::string& fileRef,
                                      Completion complete,
                                      const streamgate::common::CancelTokenPtr& cancel)>;

    struct Config {
        size_t maxEntries{1024};
        double ttlSec{3600.0};
    };

    struct Stats {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t loads{0};
        uint64_t sharedLoads{0};   // misses that joined a load already running
        uint64_t abandonedLoads{0};
        size_t entries{0};
        size_t capacity{0};
    };

    explicit MetadataCache(Config cfg);

    std::optional<upstream::FileMeta> Get(const std::string& fileRef);
    std::optional<upstream::FileMeta> GetAt(Clock::time_point now, const std::string& fileRef);

    void Put(const upstream::FileMeta& meta);
    void PutAt(Clock::time_point now, const upstream::FileMeta& meta);

    // Removes the entry. True if one was present.
    bool Invalidate(const std::string& fileRef);

    // Hands the cached value, or the outcome of one load shared by every
    // concurrent miss, to waiter. Never blocks. Returns 0 when waiter already
    // ran with a hit, otherwise a ticket for Leave(). waiter runs on the
    // thread that completes the load.
    uint64_t Fetch(const std::string& fileRef, Waiter waiter, const Loader& loader);
    uint64_t FetchAt(Clock::time_point now, const std::string& fileRef, Waiter waiter, const Loader& loader);

    // Withdraws a waiter; its callback will not run. The last one leaving
    // cancels the load.
    void Leave(const std::string& fileRef, uint64_t ticket);

    size_t Size() const;
    Stats GetStats() const;

private:
    struct Entry {
        upstream::FileMeta meta;
        Clock::time_point storedAt;
    };
    using LruList = std::list<Entry>;

    struct InFlight {
        bool done{false};
        Clock::time_point startedAt;      // caller's clock
        Clock::time_point startedReal;
        std::vector<std::pair<uint64_t, Waiter>> waiters;
        streamgate::common::CancelTokenPtr cancel;
    };
    using InFlightPtr = std::shared_ptr<InFlight>;

    std::optional<upstream::FileMeta> LookupLocked(Clock::time_point now, const std::string& fileRef);
    void InsertLocked(Clock::time_point now, const upstream::FileMeta& meta);
    void Resolve(const InFlightPtr& flight, const std::string& fileRef, upstream::MetaResult result);

    const Config cfg_;
    const Clock::duration ttl_;

    mutable std::mutex mutex_;
    LruList lru_;   // most recently used first
    std::unordered_map<std::string, LruList::iterator> index_;
    std::unordered_map<std::string, InFlightPtr> inflight_;
    uint64_t nextTicket_{1};
    Stats stats_;
};

} // namespace stream
} // namespace streamgate
