#include "gateway/network/SignalWatcher.h"
#include "gateway/common/Logger.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace gateway {
namespace network {

SignalWatcher::SignalWatcher(EventLoop* loop, const std::vector<int>& signals, Callback cb)
    : loop_(loop),
      callback_(std::move(cb)) {
    sigemptyset(&mask_);
    for (int sig : signals) sigaddset(&mask_, sig);
    if (::pthread_sigmask(SIG_BLOCK, &mask_, &previousMask_) != 0) {
        LOG_ERROR << "SignalWatcher pthread_sigmask failed";
        return;
    }
    fd_ = ::signalfd(-1, &mask_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERROR << "SignalWatcher signalfd failed: " << std::strerror(errno);
        ::pthread_sigmask(SIG_SETMASK, &previousMask_, nullptr);
        return;
    }
    channel_.reset(new Channel(loop_, fd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
}

SignalWatcher::~SignalWatcher() {
    if (fd_ < 0) return;
    loop_->ReleaseChannel(std::move(channel_));
    ::close(fd_);
    ::pthread_sigmask(SIG_SETMASK, &previousMask_, nullptr);
}

void SignalWatcher::HandleRead() {
    struct signalfd_siginfo info;
    while (true) {
        const ssize_t n = ::read(fd_, &info, sizeof info);
        if (n != static_cast<ssize_t>(sizeof info)) {
            if (n < 0 && errno == EINTR) continue;
            return;
        }
        const int signo = static_cast<int>(info.ssi_signo);
        LOG_INFO << "Received signal " << signo << " (" << ::strsignal(signo) << ")";
        if (callback_) callback_(signo);
    }
}

} // namespace network
} // namespace gateway
