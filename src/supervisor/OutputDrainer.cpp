#include "gateway/supervisor/OutputDrainer.h"
#include "gateway/common/Logger.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace gateway {
namespace supervisor {

OutputDrainer::OutputDrainer(gateway::network::EventLoop* loop, int fd, std::string name, LineCallback sink)
    : loop_(loop),
      fd_(fd),
      name_(std::move(name)),
      sink_(std::move(sink)) {
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_WARN << "OutputDrainer " << name_ << " cannot set O_NONBLOCK errno=" << errno;
    }
    channel_.reset(new gateway::network::Channel(loop_, fd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    // EPOLLHUP without EPOLLIN still has to reach HandleRead to see EOF.
    channel_->SetCloseCallback([this]() { HandleRead(); });
}

OutputDrainer::~OutputDrainer() {
    if (channel_) {
        if (channel_->IsRegistered()) {
            channel_->DisableAll();
            channel_->Remove();
        }
        channel_.reset();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void OutputDrainer::Start() {
    if (fd_ < 0 || !channel_) return;
    channel_->EnableReading();
}

void OutputDrainer::DrainNow() {
    while (fd_ >= 0 && ReadOnce()) {
    }
}

void OutputDrainer::HandleRead() {
    if (fd_ < 0) return;
    // Bounded per wakeup so a chatty worker cannot starve the loop.
    for (int i = 0; i < 16 && fd_ >= 0; ++i) {
        if (!ReadOnce()) return;
    }
}

bool OutputDrainer::ReadOnce() {
    char buf[4096];
    const ssize_t n = ::read(fd_, buf, sizeof buf);
    if (n > 0) {
        partial_.append(buf, static_cast<size_t>(n));
        SplitLines(false);
        return true;
    }
    if (n < 0 && errno == EINTR) return true;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return false;

    if (n < 0) {
        LOG_WARN << "OutputDrainer " << name_ << " read error: " << std::strerror(errno);
    }
    SplitLines(true);
    Close();
    return false;
}

void OutputDrainer::SplitLines(bool flushPartial) {
    size_t start = 0;
    while (true) {
        const size_t nl = partial_.find('\n', start);
        if (nl == std::string::npos) break;
        size_t end = nl;
        if (end > start && partial_[end - 1] == '\r') --end;
        ++lines_;
        if (sink_) sink_(partial_.substr(start, end - start));
        start = nl + 1;
    }
    partial_.erase(0, start);

    while (partial_.size() >= kMaxLineBytes) {
        ++lines_;
        if (sink_) sink_(partial_.substr(0, kMaxLineBytes));
        partial_.erase(0, kMaxLineBytes);
    }
    if (flushPartial && !partial_.empty()) {
        ++lines_;
        if (sink_) sink_(partial_);
        partial_.clear();
    }
}

void OutputDrainer::Close() {
    if (fd_ < 0) return;
    LOG_DEBUG << "OutputDrainer " << name_ << " reached end of stream after " << lines_ << " lines";
    // May run inside the channel's own callback.
    loop_->ReleaseChannel(std::move(channel_));
    ::close(fd_);
    fd_ = -1;
}

} // namespace supervisor
} // namespace gateway
