#pragma once

#include "streamgate/common/CancelToken.h"
#include "streamgate/common/WorkerPool.h"
#include "streamgate/common/noncopyable.h"
#include "streamgate/limiter/AdmissionController.h"
#include "streamgate/network/Callbacks.h"
#include "streamgate/network/TimerQueue.h"
#include "streamgate/protocol/ByteRange.h"
#include "streamgate/protocol/HttpServer.h"
#include "streamgate/stream/Directory.h"
#include "streamgate/stream/GatewayError.h"
#include "streamgate/stream/GatewayStats.h"
#include "streamgate/stream/LinkPath.h"
#include "streamgate/stream/MetadataCache.h"
#include "streamgate/upstream/ChunkFetcher.h"
#include "streamgate/upstream/ClientPool.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace streamgate {
namespace network {
class EventLoop;
}

namespace stream {

struct SessionOptions {
    upstream::FetchPolicy fetch;
    double acquireTimeoutSec{10.0};    // how long a session waits on a blocked pool
    double acquireRetrySec{0.25};
    double fetchTimeoutSec{60.0};      // per chunk, including its retries
    double metaTimeoutSec{30.0};       // one shared metadata load, acquire included
    size_t sendHighWater{4 * 1024 * 1024};
    int maxReacquire{1};               // fresh handles after flood-wait or revocation
    bool requireSecureHash{false};     // reject links that carry no hash
};

// Collaborators shared by every session; owned by StreamGateway.
struct SessionDeps {
    upstream::ClientPool* pool{nullptr};
    limiter::AdmissionController* admission{nullptr};
    MetadataCache* cache{nullptr};
    LinkStore* links{nullptr};
    const PriorityClassifier* classifier{nullptr};
    streamgate::common::WorkerPool* workers{nullptr};
    GatewayStats* stats{nullptr};
    SessionOptions options;
};

// One GET/HEAD of a link, from request parsing to the last body byte.
// Lives on its connection's loop; blocking work goes to the worker pool and
// comes back through RunInLoop.
class StreamSession : public protocol::HttpExchange,
                      public std::enable_shared_from_this<StreamSession>,
                      streamgate::common::noncopyable {
public:
    enum class State { kReceived, kMetaResolved, kAdmitted, kStreaming, kCompleted, kFailed, kCancelled };

    StreamSession(const SessionDeps& deps,
                  const network::TcpConnectionPtr& conn,
                  uint64_t requestId,
                  LinkPath link,
                  bool headOnly,
                  bool keepAlive,
                  std::string rangeHeader,
                  protocol::HttpServer::CompletionCallback done);
    ~StreamSession() override;

    void Start();

    void OnWritable() override;
    void OnPeerClosed() override;

    State state() const { return state_; }
    uint64_t bytesServed() const { return bytesServed_; }
    static const char* StateName(State state);

private:
    network::TcpConnectionPtr LiveConnection();

    void OnLinkResolved(std::optional<LinkRecord> link, limiter::PriorityClass cls);
    void ResolveMetadata();
    void OnMetadata(const upstream::MetaResult& result);
    void RequestAdmission();
    void OnAdmissionResolved(const limiter::AdmissionDecision& decision);
    void OnAdmitted();

    void Acquire();

    void StartStreaming(upstream::ClientPool::LeasePtr lease);
    void FetchNext();
    void OnChunk(uint64_t seq, upstream::RangeStream::Status status, std::shared_ptr<std::string> chunk);
    void OnFetchTimeout(uint64_t seq);
    bool TryReacquire(upstream::RangeStream::Status status);

    void SendHeaders();
    void Complete();
    void Fail(GatewayError error, double retryAfterSec = 0.0);
    void Finish(State terminal);
    void CancelTimers();

    const SessionDeps& deps_;
    network::EventLoop* loop_;
    std::weak_ptr<network::TcpConnection> conn_;
    const uint64_t requestId_;
    const std::string linkId_;
    const std::string nameHint_;
    const std::string secureHash_;
    const bool hashGiven_;
    const bool headOnly_;
    const bool keepAlive_;
    const std::string rangeHeader_;
    protocol::HttpServer::CompletionCallback done_;

    State state_{State::kReceived};
    bool finished_{false};
    bool queued_{false};
    bool rangeSyntaxOk_{true};
    protocol::RangeSpec rangeSpec_;
    protocol::ByteRange range_;
    bool emptyEntity_{false};

    LinkRecord link_;
    limiter::PriorityClass cls_{limiter::PriorityClass::kRegular};
    upstream::FileMeta meta_;
    uint64_t metaTicket_{0};
    bool metaPending_{false};

    streamgate::common::CancelTokenPtr cancel_;
    upstream::ClientPool::LeasePtr lease_;
    std::shared_ptr<upstream::RangeStream> stream_;
    std::chrono::steady_clock::time_point acquireDeadline_;
    bool headersSent_{false};
    bool fetchInFlight_{false};
    bool awaitingWritable_{false};
    uint64_t fetchSeq_{0};
    uint64_t bytesServed_{0};
    int reacquires_{0};

    network::TimerId retryTimer_{0};
    network::TimerId fetchTimer_{0};
};

using StreamSessionPtr = std::shared_ptr<StreamSession>;

} // namespace stream
} // namespace streamgate
