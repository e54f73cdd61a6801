#include "gateway/network/EpollPoller.h"
#include "gateway/network/Channel.h"
#include "gateway/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <unistd.h>

namespace gateway {
namespace network {

namespace {
// Channel::index() states.
const int kNew = -1;
const int kAdded = 1;
const int kParked = 2;
} // namespace

EpollPoller::EpollPoller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeoutMs, ChannelList* activeChannels) {
    const int numEvents = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (numEvents > 0) {
        FillActiveChannels(numEvents, activeChannels);
        // A full batch means more may be waiting; grow for the next round.
        if (static_cast<size_t>(numEvents) == events_.size()) {
            events_.resize(events_.size() * 2);
        }
    } else if (numEvents < 0 && savedErrno != EINTR) {
        // EINTR is routine: signals arrive through the signalfd, not handlers.
        LOG_ERROR << "epoll_wait failed: " << std::strerror(savedErrno);
    }
    return now;
}

void EpollPoller::FillActiveChannels(int numEvents, ChannelList* activeChannels) const {
    for (int i = 0; i < numEvents; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(events_[i].events);
        activeChannels->push_back(channel);
    }
}

bool EpollPoller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    const int index = channel->index();

    if (index == kNew || index == kParked) {
        if (index == kNew) {
            channels_[channel->fd()] = channel;
        }
        if (channel->IsNoneEvent()) {
            // Nothing to watch yet; stays known to the poller but out of epoll.
            channel->set_index(kParked);
            return;
        }
        channel->set_index(kAdded);
        Update(EPOLL_CTL_ADD, channel);
    } else {
        if (channel->IsNoneEvent()) {
            Update(EPOLL_CTL_DEL, channel);
            channel->set_index(kParked);
        } else {
            Update(EPOLL_CTL_MOD, channel);
        }
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    const int fd = channel->fd();
    auto it = channels_.find(fd);
    if (it != channels_.end() && it->second == channel) {
        channels_.erase(it);
    }

    if (channel->index() == kAdded) {
        Update(EPOLL_CTL_DEL, channel);
    }
    channel->set_index(kNew);
}

void EpollPoller::Update(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = channel->events();
    event.data.ptr = channel;
    int fd = channel->fd();
    if (::epoll_ctl(epollfd_, operation, fd, &event) < 0) {
        // The pidfd or a pipe may already be closed by the other side's exit;
        // a failed DEL is only worth a log line.
        if (operation == EPOLL_CTL_DEL) {
            LOG_ERROR << "epoll_ctl DEL fd=" << fd << ": " << std::strerror(errno);
        } else {
            LOG_FATAL << "epoll_ctl op=" << operation << " fd=" << fd << ": " << std::strerror(errno);
        }
    }
}

} // namespace network
} // namespace gateway
