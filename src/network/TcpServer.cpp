#include "streamgate/network/TcpServer.h"
#include "streamgate/network/Acceptor.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/common/Logger.h"

#include <unistd.h>
#include <vector>

namespace streamgate {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      nextConnId_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { NewConnection(sockfd, peer); });
}

TcpServer::~TcpServer() {
    if (cleanupTimer_ != 0) loop_->CancelTimer(cleanupTimer_);
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop([conn] { conn->ConnectDestroyed(); });
    }
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    auto ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

void TcpServer::SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec) {
    idleTimeoutSec_ = idleTimeoutSec;
    cleanupIntervalSec_ = (cleanupIntervalSec > 0.0) ? cleanupIntervalSec : 1.0;
}

void TcpServer::Start() {
    if (started_++ != 0) return;
    threadPool_->Start();
    if (idleTimeoutSec_ > 0.0) {
        cleanupTimer_ = loop_->RunEvery(cleanupIntervalSec_, [this] { CleanupIdleConnections(); });
    }
    loop_->RunInLoop([this] { acceptor_->Listen(); });
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << hostport_
             << (tlsCtx_ ? " (TLS + plain)" : "");
}

void TcpServer::CleanupIdleConnections() {
    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (const auto& item : connections_) {
        if (item.second && now - item.second->LastActiveTime() > timeout) {
            toClose.push_back(item.second);
        }
    }
    for (auto& conn : toClose) {
        LOG_INFO << "TcpServer [" << name_ << "] closing idle connection " << conn->name()
                 << " peer=" << conn->peerAddress().toIpPort();
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    if (maxConnections_ > 0 && static_cast<int>(connections_.size()) >= maxConnections_) {
        LOG_WARN << "TcpServer [" << name_ << "] reject " << peerAddr.toIpPort()
                 << ": max connections " << maxConnections_ << " reached";
        ::close(sockfd);
        return;
    }

    std::string connName = name_ + "-" + hostport_ + "#" + std::to_string(nextConnId_++);
    LOG_DEBUG << "TcpServer [" << name_ << "] new connection " << connName << " from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    auto conn = std::make_shared<TcpConnection>(ioLoop, connName, sockfd, InetAddress::LocalOf(sockfd), peerAddr,
                                                tlsCtx_ ? tlsCtx_->ctx() : nullptr);
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    ioLoop->RunInLoop([conn] { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Deferred so removal never happens inside the connection's own callbacks.
    loop_->QueueInLoop([this, conn] { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer [" << name_ << "] remove connection " << conn->name();
    connections_.erase(conn->name());
    conn->getLoop()->QueueInLoop([conn] { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace streamgate
