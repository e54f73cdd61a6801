#pragma once

#include "gateway/common/noncopyable.h"

#include <functional>
#include <memory>

namespace gateway {
namespace network {

class Channel;
class EventLoop;

// timerfd registered on a loop. One-shot by default, periodic when an
// interval is given. The callback may destroy the Timer.
class Timer : gateway::common::noncopyable {
public:
    using Callback = std::function<void()>;

    Timer(EventLoop* loop, Callback cb);
    ~Timer();

    bool Start(double delaySec, double intervalSec = 0.0);
    void Cancel();
    bool armed() const { return armed_; }

private:
    void HandleRead();

    EventLoop* loop_;
    Callback callback_;
    int timerfd_{-1};
    std::unique_ptr<Channel> channel_;
    bool armed_{false};
    bool periodic_{false};
};

} // namespace network
} // namespace gateway
