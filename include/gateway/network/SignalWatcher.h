#pragma once

#include "gateway/common/noncopyable.h"

#include <functional>
#include <memory>
#include <signal.h>
#include <vector>

namespace gateway {
namespace network {

class Channel;
class EventLoop;

// Delivers signals through a signalfd on the loop. The signals are blocked
// for the calling thread (and threads it creates later) while the watcher
// lives, so construct it before starting other threads.
class SignalWatcher : gateway::common::noncopyable {
public:
    using Callback = std::function<void(int signo)>;

    SignalWatcher(EventLoop* loop, const std::vector<int>& signals, Callback cb);
    ~SignalWatcher();

    bool valid() const { return fd_ >= 0; }

private:
    void HandleRead();

    EventLoop* loop_;
    Callback callback_;
    sigset_t mask_;
    sigset_t previousMask_;
    int fd_{-1};
    std::unique_ptr<Channel> channel_;
};

} // namespace network
} // namespace gateway
