#include "streamgate/network/Channel.h"
#include "streamgate/network/EventLoop.h"

#include <sys/epoll.h>

namespace streamgate {
namespace network {

const int Channel::kNoneEvent = 0;
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      index_(-1),
      tied_(false) {}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    tie_ = owner;
    tied_ = true;
}

void Channel::Update() {
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(Timestamp receiveTime) {
    if (tied_) {
        std::shared_ptr<void> guard = tie_.lock();
        if (guard) HandleEventWithGuard(receiveTime);
    } else {
        HandleEventWithGuard(receiveTime);
    }
}

void Channel::HandleEventWithGuard(Timestamp receiveTime) {
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        if (close_callback_) close_callback_();
    }
    if (revents_ & EPOLLERR) {
        if (error_callback_) error_callback_();
    }
    if (revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        if (read_callback_) read_callback_(receiveTime);
    }
    if (revents_ & EPOLLOUT) {
        if (write_callback_) write_callback_();
    }
}

} // namespace network
} // namespace streamgate
