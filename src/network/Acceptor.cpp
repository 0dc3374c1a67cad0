#include "streamgate/network/Acceptor.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/network/InetAddress.h"
#include "streamgate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace streamgate {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(Socket::CreateNonblockingOrDie()),
      accept_channel_(loop, accept_socket_.fd()),
      listening_(false),
      idle_fd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);
    accept_socket_.BindAddress(listenAddr);
    accept_channel_.SetReadCallback([this](Timestamp) { HandleRead(); });
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
    if (idle_fd_ >= 0) ::close(idle_fd_);
}

void Acceptor::Listen() {
    listening_ = true;
    accept_socket_.Listen();
    accept_channel_.EnableReading();
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
        return;
    }

    const int savedErrno = errno;
    LOG_ERROR << "accept failed: " << std::strerror(savedErrno);
    if (savedErrno == EMFILE && idle_fd_ >= 0) {
        ::close(idle_fd_);
        idle_fd_ = ::accept(accept_socket_.fd(), nullptr, nullptr);
        if (idle_fd_ >= 0) ::close(idle_fd_);
        idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
}

} // namespace network
} // namespace streamgate
