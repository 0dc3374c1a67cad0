#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/network/Channel.h"
#include "streamgate/network/Socket.h"

#include <functional>

namespace streamgate {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : streamgate::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { new_connection_callback_ = std::move(cb); }

    bool listening() const { return listening_; }
    void Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listening_;
    // Spare fd released to shed a connection when the process hits EMFILE.
    int idle_fd_;
};

} // namespace network
} // namespace streamgate
