#include "streamgate/network/InetAddress.h"
#include "streamgate/common/Logger.h"

#include <arpa/inet.h>
#include <cstring>
#include <sys/socket.h>

namespace streamgate {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_addr.s_addr = htonl(loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) <= 0) {
        LOG_ERROR << "InetAddress: invalid IPv4 address " << ip << ", using 0.0.0.0";
        addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    }
}

std::string InetAddress::toIp() const {
    char buf[INET_ADDRSTRLEN] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    return toIp() + ":" + std::to_string(toPort());
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

InetAddress InetAddress::LocalOf(int sockfd) {
    struct sockaddr_in local;
    std::memset(&local, 0, sizeof local);
    socklen_t len = sizeof local;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        LOG_ERROR << "getsockname failed fd=" << sockfd;
    }
    return InetAddress(local);
}

} // namespace network
} // namespace streamgate
