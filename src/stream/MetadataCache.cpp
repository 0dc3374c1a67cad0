#include "streamgate/stream/MetadataCache.h"
#include "streamgate/common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace streamgate {
namespace stream {

MetadataCache::MetadataCache(Config cfg)
    : cfg_(cfg),
      ttl_(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cfg.ttlSec))) {
    if (cfg_.maxEntries == 0) {
        throw std::invalid_argument("cache: max_entries must be > 0");
    }
    if (cfg_.ttlSec <= 0.0) {
        throw std::invalid_argument("cache: ttl_sec must be > 0");
    }
}

std::optional<upstream::FileMeta> MetadataCache::LookupLocked(Clock::time_point now, const std::string& fileRef) {
    auto it = index_.find(fileRef);
    if (it == index_.end()) return std::nullopt;
    if (now - it->second->storedAt >= ttl_) {
        lru_.erase(it->second);
        index_.erase(it);
        return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->meta;
}

void MetadataCache::InsertLocked(Clock::time_point now, const upstream::FileMeta& meta) {
    auto it = index_.find(meta.fileRef);
    if (it != index_.end()) {
        it->second->meta = meta;
        it->second->storedAt = now;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }
    lru_.push_front(Entry{meta, now});
    index_[meta.fileRef] = lru_.begin();
    while (lru_.size() > cfg_.maxEntries) {
        index_.erase(lru_.back().meta.fileRef);
        lru_.pop_back();
    }
}

std::optional<upstream::FileMeta> MetadataCache::Get(const std::string& fileRef) {
    return GetAt(Clock::now(), fileRef);
}

std::optional<upstream::FileMeta> MetadataCache::GetAt(Clock::time_point now, const std::string& fileRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto meta = LookupLocked(now, fileRef);
    if (meta) {
        stats_.hits++;
    } else {
        stats_.misses++;
    }
    return meta;
}

void MetadataCache::Put(const upstream::FileMeta& meta) {
    PutAt(Clock::now(), meta);
}

void MetadataCache::PutAt(Clock::time_point now, const upstream::FileMeta& meta) {
    std::lock_guard<std::mutex> lock(mutex_);
    InsertLocked(now, meta);
}

bool MetadataCache::Invalidate(const std::string& fileRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(fileRef);
    if (it == index_.end()) return false;
    lru_.erase(it->second);
    index_.erase(it);
    LOG_DEBUG << "MetadataCache: invalidated " << fileRef;
    return true;
}

uint64_t MetadataCache::Fetch(const std::string& fileRef, Waiter waiter, const Loader& loader) {
    return FetchAt(Clock::now(), fileRef, std::move(waiter), loader);
}

uint64_t MetadataCache::FetchAt(Clock::time_point now, const std::string& fileRef, Waiter waiter,
                                const Loader& loader) {
    InFlightPtr flight;
    uint64_t ticket = 0;
    std::optional<upstream::FileMeta> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached = LookupLocked(now, fileRef);
        if (cached) {
            stats_.hits++;
        } else {
            stats_.misses++;
            ticket = nextTicket_++;
            auto it = inflight_.find(fileRef);
            if (it != inflight_.end()) {
                stats_.sharedLoads++;
                it->second->waiters.emplace_back(ticket, std::move(waiter));
                return ticket;
            }
            flight = std::make_shared<InFlight>();
            flight->startedAt = now;
            flight->startedReal = Clock::now();
            flight->cancel = std::make_shared<streamgate::common::CancelToken>();
            flight->waiters.emplace_back(ticket, std::move(waiter));
            inflight_[fileRef] = flight;
            stats_.loads++;
        }
    }
    if (cached) {
        upstream::MetaResult hit;
        hit.meta = *cached;
        waiter(hit);
        return 0;
    }

    std::weak_ptr<InFlight> weak(flight);
    Completion complete = [this, weak, fileRef](const upstream::MetaResult& result) {
        if (InFlightPtr f = weak.lock()) Resolve(f, fileRef, result);
    };
    try {
        loader(fileRef, std::move(complete), flight->cancel);
    } catch (const std::exception& e) {
        upstream::MetaResult failed;
        failed.error = upstream::UpstreamError::Fatal(std::string("metadata loader threw: ") + e.what());
        Resolve(flight, fileRef, failed);
    }
    return ticket;
}

void MetadataCache::Resolve(const InFlightPtr& flight, const std::string& fileRef, upstream::MetaResult result) {
    std::vector<std::pair<uint64_t, Waiter>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (flight->done) return;
        flight->done = true;
        auto it = inflight_.find(fileRef);
        if (it != inflight_.end() && it->second == flight) inflight_.erase(it);
        if (result.error.ok()) {
            result.meta.fileRef = fileRef;
            // The entry's age starts when the load finished, not when it began.
            InsertLocked(flight->startedAt + (Clock::now() - flight->startedReal), result.meta);
        }
        waiters.swap(flight->waiters);
    }
    for (auto& w : waiters) w.second(result);
}

void MetadataCache::Leave(const std::string& fileRef, uint64_t ticket) {
    if (ticket == 0) return;
    streamgate::common::CancelTokenPtr abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inflight_.find(fileRef);
        if (it == inflight_.end()) return;
        InFlight& flight = *it->second;
        auto w = std::find_if(flight.waiters.begin(), flight.waiters.end(),
                              [ticket](const std::pair<uint64_t, Waiter>& p) { return p.first == ticket; });
        if (w == flight.waiters.end()) return;
        flight.waiters.erase(w);
        if (!flight.waiters.empty()) return;
        flight.done = true;
        abandoned = flight.cancel;
        inflight_.erase(it);
        stats_.abandonedLoads++;
    }
    LOG_DEBUG << "MetadataCache: nobody waits for " << fileRef << " any more, cancelling its load";
    abandoned->Cancel();
}

size_t MetadataCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

MetadataCache::Stats MetadataCache::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s = stats_;
    s.entries = lru_.size();
    s.capacity = cfg_.maxEntries;
    return s;
}

} // namespace stream
} // namespace streamgate
