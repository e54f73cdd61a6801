#pragma once

#include "gateway/common/noncopyable.h"

#include <chrono>
#include <sys/epoll.h>
#include <unordered_map>
#include <vector>

namespace gateway {
namespace network {

class Channel;

// Level-triggered epoll set owned by one EventLoop. The gateway only ever
// runs on Linux, so there is no other backend behind an interface.
class EpollPoller : gateway::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    // Fills activeChannels with the ready channels and returns the wake time.
    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* activeChannels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int numEvents, ChannelList* activeChannels) const;
    void Update(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
    // fd -> channel, including channels parked out of epoll with no events.
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace gateway
