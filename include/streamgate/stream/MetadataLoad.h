#pragma once

#include "streamgate/common/CancelToken.h"
#include "streamgate/common/noncopyable.h"
#include "streamgate/network/TimerQueue.h"
#include "streamgate/stream/MetadataCache.h"
#include "streamgate/upstream/ClientPool.h"

#include <chrono>
#include <memory>
#include <string>

namespace streamgate {
namespace network {
class EventLoop;
}

namespace stream {

struct SessionDeps;

// One shared metadata load started by MetadataCache on behalf of every
// session waiting for fileRef. It holds the only lease for the load and
// belongs to no session, so a leader that disconnects strands nobody.
// Gives up at the deadline, and releases its client as soon as the cache
// reports that every waiter has left. Loop thread only.
class MetadataLoad : public std::enable_shared_from_this<MetadataLoad>,
                     streamgate::common::noncopyable {
public:
    static void Start(const SessionDeps& deps,
                      network::EventLoop* loop,
                      const std::string& fileRef,
                      MetadataCache::Completion complete,
                      const streamgate::common::CancelTokenPtr& cancel);

    MetadataLoad(const SessionDeps& deps,
                 network::EventLoop* loop,
                 std::string fileRef,
                 MetadataCache::Completion complete,
                 streamgate::common::CancelTokenPtr cancel);

private:
    void Begin();
    void Attempt();
    void Load(upstream::ClientPool::LeasePtr lease);
    void OnResult(uint64_t attempt, const upstream::MetaResult& result);
    void OnDeadline();
    void Abort();
    void Finish(const upstream::MetaResult& result);
    void Stop();
    void ResetAcquireDeadline();

    const SessionDeps& deps_;
    network::EventLoop* loop_;
    const std::string fileRef_;
    MetadataCache::Completion complete_;
    streamgate::common::CancelTokenPtr cancel_;

    upstream::ClientPool::LeasePtr lease_;
    std::chrono::steady_clock::time_point acquireDeadline_;
    uint64_t attempt_{0};
    int reacquires_{0};
    bool done_{false};
    network::TimerId retryTimer_{0};
    network::TimerId deadlineTimer_{0};
};

} // namespace stream
} // namespace streamgate
