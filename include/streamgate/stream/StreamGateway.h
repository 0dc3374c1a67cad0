#pragma once

#include "streamgate/common/WorkerPool.h"
#include "streamgate/common/noncopyable.h"
#include "streamgate/limiter/AdmissionController.h"
#include "streamgate/network/InetAddress.h"
#include "streamgate/network/TimerQueue.h"
#include "streamgate/protocol/HttpServer.h"
#include "streamgate/stream/Directory.h"
#include "streamgate/stream/GatewayStats.h"
#include "streamgate/stream/MetadataCache.h"
#include "streamgate/stream/StreamSession.h"
#include "streamgate/upstream/ClientPool.h"

#include <atomic>
#include <memory>
#include <string>

namespace streamgate {
namespace network {
class EventLoop;
}

namespace stream {

// HTTP front of the gateway: GET/HEAD of a link path (see LinkPath.h)
// streams a file, GET /status reports pool, queue and cache state.
class StreamGateway : streamgate::common::noncopyable {
public:
    struct Options {
        std::string name{"StreamGate"};
        std::string version{"1.0.0"};
        int ioThreads{4};
        int workerThreads{16};
        double drainIntervalSec{0.5};
        double idleTimeoutSec{300.0};
        int maxConnections{0};
        SessionOptions session;
    };

    struct Components {
        std::shared_ptr<upstream::ClientPool> pool;
        std::shared_ptr<limiter::AdmissionController> admission;
        std::shared_ptr<MetadataCache> cache;
        std::shared_ptr<LinkStore> links;
        std::shared_ptr<PriorityClassifier> classifier;
    };

    // Throws std::invalid_argument when a component is missing.
    StreamGateway(network::EventLoop* loop,
                  const network::InetAddress& listenAddr,
                  Options options,
                  Components components);
    ~StreamGateway();

    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Base loop thread.
    void Start();
    // Rejects queued requests and joins the workers. Idempotent.
    void Stop();

    std::string StatusJson() const;

    GatewayStats& stats() { return stats_; }
    const Components& components() const { return parts_; }

private:
    protocol::HttpExchangePtr OnRequest(const network::TcpConnectionPtr& conn,
                                        const protocol::HttpRequest& req,
                                        const protocol::HttpServer::CompletionCallback& done);

    network::EventLoop* loop_;
    const Options opts_;
    const Components parts_;
    GatewayStats stats_;
    streamgate::common::WorkerPool workers_;
    SessionDeps deps_;
    protocol::HttpServer server_;
    network::TimerId drainTimer_{0};
    std::atomic<uint64_t> nextRequestId_{1};
    bool stopped_{false};
};

} // namespace stream
} // namespace streamgate
