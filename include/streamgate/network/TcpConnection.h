#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/network/Buffer.h"
#include "streamgate/network/Callbacks.h"
#include "streamgate/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace streamgate {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One accepted client connection, bound to a single I/O loop.
// When a TLS context is given, the first byte decides whether the peer
// speaks TLS (handshake record 0x16) or plaintext.
class TcpConnection : streamgate::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }
    bool isTls() const { return ssl_ != nullptr; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();

    // Loop thread only.
    size_t PendingOutputBytes() const { return outputBuffer_.ReadableBytes(); }
    Buffer* inputBuffer() { return &inputBuffer_; }

    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) {
        highWaterMarkCallback_ = cb;
        highWaterMark_ = highWaterMark;
    }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called by TcpServer once the connection is registered.
    void ConnectEstablished();
    // Called by TcpServer after it dropped the connection from its map.
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum class TlsState { kUndecided, kPlain, kHandshake, kEstablished };

    void HandleRead(Timestamp receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* data, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void Touch();

    // Returns bytes written, 0 when the socket would block, -1 on a fatal error.
    ssize_t WriteRaw(const void* data, size_t len);
    // Decides plain vs TLS from the first byte. False if nothing is readable yet.
    bool SniffTls();
    bool ContinueHandshake();
    // Drains all decrypted bytes into inputBuffer_. Returns >0, 0 on close, -1 on error, -2 on would-block.
    ssize_t ReadTls();

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> lastActiveNs_;

    ssl_ctx_st* tlsCtx_{nullptr};
    ssl_st* ssl_{nullptr};
    TlsState tlsState_{TlsState::kUndecided};
};

} // namespace network
} // namespace streamgate
