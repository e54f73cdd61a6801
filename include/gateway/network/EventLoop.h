#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "gateway/common/noncopyable.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EpollPoller.h"

namespace gateway {
namespace network {

// One loop per thread. Everything registered on it (sockets, timers, pipes,
// pidfd, signalfd) is dispatched from Loop().
class EventLoop : gateway::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    // Unregisters the channel now and frees it after the current poll round,
    // so it is safe to call from inside the channel's own callback.
    void ReleaseChannel(std::unique_ptr<Channel> channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void HandleRead(); // For wakeup
    void DoPendingFunctors();

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<EpollPoller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace gateway
