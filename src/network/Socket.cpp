#include "streamgate/network/Socket.h"
#include "streamgate/network/InetAddress.h"
#include "streamgate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace streamgate {
namespace network {

Socket::~Socket() {
    ::close(sockfd_);
}

int Socket::CreateNonblockingOrDie() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "socket() failed: " << std::strerror(errno);
    }
    return sockfd;
}

void Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) != 0) {
        LOG_FATAL << "bind " << localaddr.toIpPort() << " failed: " << std::strerror(errno);
    }
}

void Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        LOG_FATAL << "listen failed: " << std::strerror(errno);
    }
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_ERROR << "shutdown(SHUT_WR) fd=" << sockfd_ << ": " << std::strerror(errno);
    }
}

void Socket::SetOption(int level, int name, bool on) {
    int optval = on ? 1 : 0;
    if (::setsockopt(sockfd_, level, name, &optval, sizeof optval) < 0) {
        LOG_WARN << "setsockopt(" << level << "," << name << ") fd=" << sockfd_ << ": " << std::strerror(errno);
    }
}

void Socket::SetTcpNoDelay(bool on) { SetOption(IPPROTO_TCP, TCP_NODELAY, on); }
void Socket::SetReuseAddr(bool on) { SetOption(SOL_SOCKET, SO_REUSEADDR, on); }
void Socket::SetReusePort(bool on) { SetOption(SOL_SOCKET, SO_REUSEPORT, on); }
void Socket::SetKeepAlive(bool on) { SetOption(SOL_SOCKET, SO_KEEPALIVE, on); }

} // namespace network
} // namespace streamgate
