#pragma once

#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"

#include <functional>
#include <memory>
#include <string>

namespace gateway {
namespace upstream {

class HealthChecker {
public:
    using CheckCallback = std::function<void(bool healthy, const std::string& detail)>;

    explicit HealthChecker(gateway::network::EventLoop* loop) : loop_(loop) {}
    virtual ~HealthChecker() = default;

    // Async check. Callback will be called on loop thread.
    virtual void Check(const gateway::network::InetAddress& addr, CheckCallback cb) = 0;

protected:
    gateway::network::EventLoop* loop_;
};

using HealthCheckerPtr = std::shared_ptr<HealthChecker>;

} // namespace upstream
} // namespace gateway
