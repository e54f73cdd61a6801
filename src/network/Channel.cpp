#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/common/Logger.h"

#include <sys/epoll.h>

namespace gateway {
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
      added_to_loop_(false) {
}

Channel::~Channel() = default;

void Channel::Update() {
    added_to_loop_ = true;
    loop_->UpdateChannel(this);
}

// Idempotent: a drainer at EOF and its owner's destructor may both remove it.
void Channel::Remove() {
    if (!added_to_loop_) return;
    added_to_loop_ = false;
    loop_->RemoveChannel(this);
}

// Any callback may unregister the channel (an upstream attempt that finished,
// a pidfd after the reap), so registration is checked again before each one.
// The object itself stays valid until the round ends: owners hand it to
// EventLoop::ReleaseChannel instead of deleting it.
void Channel::HandleEvent(std::chrono::system_clock::time_point receive_time) {
    if (!added_to_loop_) return;

    // Pipes report a closed writer as EPOLLHUP alone once drained.
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        if (close_callback_) close_callback_();
        if (!added_to_loop_) return;
    }

    if (revents_ & EPOLLERR) {
        if (error_callback_) error_callback_();
        if (!added_to_loop_) return;
    }

    if (revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        if (read_callback_) read_callback_(receive_time);
        if (!added_to_loop_) return;
    }

    // Non-blocking connect completes (or fails) as EPOLLOUT.
    if (revents_ & EPOLLOUT) {
        if (write_callback_) write_callback_();
    }
}

} // namespace network
} // namespace gateway
