#pragma once

#include "streamgate/common/noncopyable.h"

namespace streamgate {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : streamgate::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    void BindAddress(const InetAddress& localaddr);
    void Listen();
    // Returns a non-blocking fd, or -1 with errno set.
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static int CreateNonblockingOrDie();

private:
    void SetOption(int level, int name, bool on);

    const int sockfd_;
};

} // namespace network
} // namespace streamgate
