#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/network/Callbacks.h"
#include <sys/epoll.h>
#include <unordered_map>
#include <vector>

namespace streamgate {
namespace network {

class Channel;
class EventLoop;

// epoll(7) demultiplexer owned by one EventLoop.
class Poller : streamgate::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    ~Poller();

    Timestamp Poll(int timeoutMs, ChannelList* activeChannels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void Update(int operation, Channel* channel);

    EventLoop* loop_;
    int epollfd_;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace streamgate
