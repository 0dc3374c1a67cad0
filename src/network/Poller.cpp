#include "streamgate/network/Poller.h"
#include "streamgate/network/Channel.h"
#include "streamgate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace streamgate {
namespace network {

namespace {
const int kNew = -1;
const int kAdded = 1;
const int kDeleted = 2;
}

Poller::Poller(EventLoop* loop)
    : loop_(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
    }
}

Poller::~Poller() {
    ::close(epollfd_);
}

Timestamp Poller::Poll(int timeoutMs, ChannelList* activeChannels) {
    int numEvents = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    int savedErrno = errno;
    Timestamp now = std::chrono::system_clock::now();

    if (numEvents > 0) {
        for (int i = 0; i < numEvents; ++i) {
            Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
            channel->set_revents(static_cast<int>(events_[i].events));
            activeChannels->push_back(channel);
        }
        if (static_cast<size_t>(numEvents) == events_.size()) {
            events_.resize(events_.size() * 2);
        }
    } else if (numEvents < 0 && savedErrno != EINTR) {
        LOG_ERROR << "epoll_wait failed: " << std::strerror(savedErrno);
    }
    return now;
}

void Poller::UpdateChannel(Channel* channel) {
    const int index = channel->index();
    if (index == kNew || index == kDeleted) {
        if (index == kNew) {
            channels_[channel->fd()] = channel;
        }
        channel->set_index(kAdded);
        Update(EPOLL_CTL_ADD, channel);
    } else if (channel->IsNoneEvent()) {
        Update(EPOLL_CTL_DEL, channel);
        channel->set_index(kDeleted);
    } else {
        Update(EPOLL_CTL_MOD, channel);
    }
}

void Poller::RemoveChannel(Channel* channel) {
    channels_.erase(channel->fd());
    if (channel->index() == kAdded) {
        Update(EPOLL_CTL_DEL, channel);
    }
    channel->set_index(kNew);
}

bool Poller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

void Poller::Update(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = static_cast<uint32_t>(channel->events());
    event.data.ptr = channel;
    if (::epoll_ctl(epollfd_, operation, channel->fd(), &event) < 0) {
        if (operation == EPOLL_CTL_DEL) {
            LOG_ERROR << "epoll_ctl DEL fd=" << channel->fd() << ": " << std::strerror(errno);
        } else {
            LOG_FATAL << "epoll_ctl op=" << operation << " fd=" << channel->fd() << ": " << std::strerror(errno);
        }
    }
}

} // namespace network
} // namespace streamgate
