#pragma once

#include "gateway/common/noncopyable.h"

#include <functional>
#include <memory>
#include <string>

namespace gateway {

namespace network {
class Channel;
class EventLoop;
} // namespace network

namespace supervisor {

// Reads one pipe end of the worker on the loop and hands every complete line
// to the sink. Closes itself on EOF or a read error; a trailing line without
// '\n' is flushed first.
class OutputDrainer : gateway::common::noncopyable {
public:
    using LineCallback = std::function<void(const std::string& line)>;

    // Takes ownership of fd and makes it non-blocking.
    OutputDrainer(gateway::network::EventLoop* loop, int fd, std::string name, LineCallback sink);
    ~OutputDrainer();

    void Start();

    // Reads whatever is left without waiting for the loop. Used once the
    // worker is known to be gone.
    void DrainNow();

    const std::string& name() const { return name_; }
    bool closed() const { return fd_ < 0; }
    size_t linesForwarded() const { return lines_; }

    // Longer lines are cut and forwarded in pieces.
    static const size_t kMaxLineBytes = 64 * 1024;

private:
    void HandleRead();
    // Returns false once the stream is finished.
    bool ReadOnce();
    void SplitLines(bool flushPartial);
    void Close();

    gateway::network::EventLoop* loop_;
    int fd_;
    const std::string name_;
    LineCallback sink_;
    std::unique_ptr<gateway::network::Channel> channel_;
    std::string partial_;
    size_t lines_{0};
};

} // namespace supervisor
} // namespace gateway
