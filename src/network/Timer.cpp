#include "gateway/network/Timer.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/timerfd.h>
#include <unistd.h>

namespace gateway {
namespace network {

namespace {

struct timespec ToTimespec(double sec) {
    struct timespec ts;
    if (sec < 0.0) sec = 0.0;
    ts.tv_sec = static_cast<time_t>(sec);
    ts.tv_nsec = static_cast<long>((sec - static_cast<double>(ts.tv_sec)) * 1e9);
    return ts;
}

} // namespace

Timer::Timer(EventLoop* loop, Callback cb)
    : loop_(loop),
      callback_(std::move(cb)) {
    timerfd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerfd_ < 0) {
        LOG_ERROR << "Timer timerfd_create failed errno=" << errno;
        return;
    }
    channel_.reset(new Channel(loop_, timerfd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Timer::~Timer() {
    loop_->ReleaseChannel(std::move(channel_));
    if (timerfd_ >= 0) ::close(timerfd_);
}

bool Timer::Start(double delaySec, double intervalSec) {
    if (timerfd_ < 0) return false;

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value = ToTimespec(delaySec);
    // A zero it_value disarms the timer; fire as soon as possible instead.
    if (howlong.it_value.tv_sec == 0 && howlong.it_value.tv_nsec == 0) {
        howlong.it_value.tv_nsec = 1000;
    }
    periodic_ = intervalSec > 0.0;
    if (periodic_) howlong.it_interval = ToTimespec(intervalSec);

    if (::timerfd_settime(timerfd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer timerfd_settime failed errno=" << errno;
        return false;
    }
    armed_ = true;
    if (!channel_->IsReading()) channel_->EnableReading();
    return true;
}

void Timer::Cancel() {
    if (timerfd_ < 0 || !armed_) return;
    struct itimerspec off;
    std::memset(&off, 0, sizeof off);
    ::timerfd_settime(timerfd_, 0, &off, nullptr);
    armed_ = false;
    if (channel_->IsReading()) channel_->DisableAll();
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    if (n != sizeof expirations) return;
    if (!armed_) return;

    if (!periodic_) {
        armed_ = false;
        channel_->DisableAll();
    }
    Callback cb = callback_;
    if (cb) cb();
}

} // namespace network
} // namespace gateway
