#include "streamgate/network/TcpConnection.h"
#include "streamgate/network/Channel.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/network/Socket.h"
#include "streamgate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace streamgate {
namespace network {

namespace {

std::int64_t ToSteadyNs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

const size_t kDefaultHighWaterMark = 64 * 1024 * 1024;

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(kDefaultHighWaterMark),
      lastActiveNs_(ToSteadyNs(std::chrono::steady_clock::now())),
      tlsCtx_(tlsCtx),
      tlsState_(tlsCtx ? TlsState::kUndecided : TlsState::kPlain) {
    channel_->SetReadCallback([this](Timestamp t) { HandleRead(t); });
    channel_->SetWriteCallback([this] { HandleWrite(); });
    channel_->SetCloseCallback([this] { HandleClose(); });
    channel_->SetErrorCallback([this] { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] fd=" << channel_->fd();
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::ConnectEstablished() {
    state_ = kConnected;
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        state_ = kDisconnected;
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::SniffTls() {
    unsigned char first = 0;
    const ssize_t n = ::recv(channel_->fd(), &first, 1, MSG_PEEK);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return false;
    if (n <= 0) {
        // EOF or error: let the plain read path report it.
        tlsState_ = TlsState::kPlain;
        return true;
    }

    if (first != 0x16) {
        tlsState_ = TlsState::kPlain;
        return true;
    }
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        LOG_WARN << "TLS: SSL_new failed for " << name_ << ", treating as plaintext";
        tlsState_ = TlsState::kPlain;
        return true;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_accept_state(s);
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = TlsState::kHandshake;
    return true;
}

// False while the handshake is still pending. Fatal failures close the connection.
bool TcpConnection::ContinueHandshake() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_accept(s);
    if (r == 1) {
        tlsState_ = TlsState::kEstablished;
        const bool pending = outputBuffer_.ReadableBytes() > 0;
        if (pending && !channel_->IsWriting()) channel_->EnableWriting();
        if (!pending && channel_->IsWriting()) channel_->DisableWriting();
        return true;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        if (channel_->IsWriting()) channel_->DisableWriting();
        return false;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return false;
    }
    char buf[256] = "unknown";
    unsigned long le = ERR_get_error();
    if (le != 0) ERR_error_string_n(le, buf, sizeof buf);
    LOG_WARN << "TLS handshake failed for " << name_ << ": " << buf;
    HandleClose();
    return false;
}

ssize_t TcpConnection::ReadTls() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    ssize_t total = 0;
    char tmp[16 * 1024];
    for (;;) {
        const int r = SSL_read(s, tmp, static_cast<int>(sizeof tmp));
        if (r > 0) {
            inputBuffer_.Append(tmp, static_cast<size_t>(r));
            total += r;
            continue;
        }
        const int e = SSL_get_error(s, r);
        if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
            return total > 0 ? total : -2;
        }
        if (total > 0) return total;
        return e == SSL_ERROR_ZERO_RETURN ? 0 : -1;
    }
}

ssize_t TcpConnection::WriteRaw(const void* data, size_t len) {
    if (len == 0) return 0;
    if (tlsState_ == TlsState::kEstablished) {
        SSL* s = reinterpret_cast<SSL*>(ssl_);
        const int r = SSL_write(s, data, static_cast<int>(len));
        if (r > 0) return r;
        const int e = SSL_get_error(s, r);
        if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return 0;
        errno = EIO;
        return -1;
    }
    const ssize_t n = ::send(channel_->fd(), data, len, MSG_NOSIGNAL);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
    return n;
}

void TcpConnection::HandleRead(Timestamp receiveTime) {
    if (tlsState_ == TlsState::kUndecided && !SniffTls()) {
        return;
    }
    if (tlsState_ == TlsState::kHandshake) {
        if (!ContinueHandshake()) return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (tlsState_ == TlsState::kEstablished) {
        n = ReadTls();
        if (n == -2) return;
        if (n == -1) savedErrno = EIO;
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
        if (n < 0 && (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK)) return;
    }

    if (n > 0) {
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else {
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (tlsState_ == TlsState::kHandshake) {
        if (!ContinueHandshake()) return;
    }
    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }

    const ssize_t n = WriteRaw(outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
    if (n > 0) {
        Touch();
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(std::bind(writeCompleteCallback_, shared_from_this()));
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else if (n < 0) {
        LOG_DEBUG << "TcpConnection::HandleWrite [" << name_ << "] " << std::strerror(errno);
        HandleClose();
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose [" << name_ << "]";
    state_ = kDisconnected;
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int optval = 0;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    int err = 0;
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    if (err != 0) {
        LOG_WARN << "TcpConnection::HandleError [" << name_ << "] SO_ERROR=" << err << " " << std::strerror(err);
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->RunInLoop([self = shared_from_this(), msg = std::move(msg)]() {
            self->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected) {
        LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "] disconnected, give up writing";
        return;
    }

    const bool canWrite = tlsState_ == TlsState::kPlain || tlsState_ == TlsState::kEstablished;
    size_t written = 0;

    if (canWrite && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        const ssize_t n = WriteRaw(data, len);
        if (n < 0) {
            if (errno == EPIPE || errno == ECONNRESET || errno == EIO) {
                LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "] peer gone";
                return;
            }
            LOG_ERROR << "TcpConnection::SendInLoop [" << name_ << "] " << std::strerror(errno);
            return;
        }
        written = static_cast<size_t>(n);
        if (written > 0) Touch();
        if (written == len) {
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(std::bind(writeCompleteCallback_, shared_from_this()));
            }
            return;
        }
    }

    const size_t remaining = len - written;
    const size_t oldLen = outputBuffer_.ReadableBytes();
    if (oldLen + remaining >= highWaterMark_ && oldLen < highWaterMark_ && highWaterMarkCallback_) {
        loop_->QueueInLoop(std::bind(highWaterMarkCallback_, shared_from_this(), oldLen + remaining));
    }
    outputBuffer_.Append(static_cast<const char*>(data) + written, remaining);
    if (canWrite && !channel_->IsWriting()) {
        channel_->EnableWriting();
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        state_ = kDisconnecting;
        loop_->RunInLoop([self = shared_from_this()] { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting() || outputBuffer_.ReadableBytes() > 0) return;
    if (ssl_ && tlsState_ == TlsState::kEstablished) {
        SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
    }
    socket_->ShutdownWrite();
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        loop_->QueueInLoop([self = shared_from_this()] { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()] {
        if (!self->reading_) {
            self->reading_ = true;
            self->channel_->EnableReading();
        }
    });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()] {
        if (self->reading_) {
            self->reading_ = false;
            self->channel_->DisableReading();
        }
    });
}

void TcpConnection::Touch() {
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::nanoseconds(lastActiveNs_.load(std::memory_order_relaxed)));
}

} // namespace network
} // namespace streamgate
