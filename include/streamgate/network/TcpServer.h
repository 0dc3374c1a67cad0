#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/network/Callbacks.h"
#include "streamgate/network/EventLoopThread.h"
#include "streamgate/network/InetAddress.h"
#include "streamgate/network/TcpConnection.h"
#include "streamgate/network/TimerQueue.h"
#include "streamgate/network/TlsContext.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace streamgate {
namespace network {

class EventLoop;
class Acceptor;

// Accepts on the base loop and spreads connections over the I/O loops.
class TcpServer : streamgate::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    void SetThreadNum(int numThreads);

    // Accepts both HTTPS and plain HTTP on the same port once enabled.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // 0 means unlimited.
    void SetMaxConnections(int maxConnections) { maxConnections_ = maxConnections; }
    // 0 disables. Checked every cleanupIntervalSec on the base loop.
    void SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec = 1.0);

    void Start();

    // Base loop thread only.
    size_t ConnectionCount() const { return connections_.size(); }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void CleanupIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;
    std::shared_ptr<TlsContext> tlsCtx_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int nextConnId_;
    ConnectionMap connections_;

    int maxConnections_{0};
    double idleTimeoutSec_{0.0};
    double cleanupIntervalSec_{1.0};
    TimerId cleanupTimer_{0};
};

} // namespace network
} // namespace streamgate
