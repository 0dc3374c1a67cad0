#pragma once

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>

namespace streamgate {
namespace testing {

inline int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

inline uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

inline void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

inline std::string recvUntilClose(int fd, int timeoutMs = 5000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[65536];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

struct ParsedResponse {
    int status{0};
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string body;
};

// Reads exactly one response framed by Content-Length. A HEAD response has
// no body regardless of Content-Length.
inline ParsedResponse readResponse(int fd, bool head = false, int timeoutMs = 10000) {
    ParsedResponse resp;
    std::string data;
    size_t headerEnd = std::string::npos;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    char buf[65536];
    while (headerEnd == std::string::npos) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        assert(n > 0);
        data.append(buf, buf + n);
        headerEnd = data.find("\r\n\r\n");
    }

    const std::string headText = data.substr(0, headerEnd);
    size_t lineEnd = headText.find("\r\n");
    const std::string statusLine = headText.substr(0, lineEnd);
    resp.status = std::atoi(statusLine.substr(9, 3).c_str());
    size_t pos = lineEnd == std::string::npos ? headText.size() : lineEnd + 2;
    while (pos < headText.size()) {
        size_t next = headText.find("\r\n", pos);
        if (next == std::string::npos) next = headText.size();
        const std::string line = headText.substr(pos, next - pos);
        const size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = line.substr(0, colon);
            for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            size_t v = colon + 1;
            while (v < line.size() && line[v] == ' ') ++v;
            resp.headers[name] = line.substr(v);
        }
        pos = next + 2;
    }

    size_t length = 0;
    auto it = resp.headers.find("content-length");
    if (it != resp.headers.end() && !head) length = static_cast<size_t>(std::strtoull(it->second.c_str(), nullptr, 10));
    resp.body = data.substr(headerEnd + 4);
    while (resp.body.size() < length) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        assert(n > 0);
        resp.body.append(buf, buf + n);
    }
    assert(resp.body.size() == length);
    return resp;
}

} // namespace testing
} // namespace streamgate
