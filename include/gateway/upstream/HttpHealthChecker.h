#pragma once

#include "gateway/upstream/HealthChecker.h"
#include "gateway/upstream/UpstreamClient.h"

#include <string>

namespace gateway {
namespace upstream {

// GET <path> with a timeout; healthy when the status is within
// [okStatusMin, okStatusMax].
class HttpHealthChecker : public HealthChecker {
public:
    HttpHealthChecker(gateway::network::EventLoop* loop,
                      double timeoutSec = 1.0,
                      std::string path = "/health",
                      int okStatusMin = 200,
                      int okStatusMax = 399);
    ~HttpHealthChecker() override = default;

    void Check(const gateway::network::InetAddress& addr, CheckCallback cb) override;

    const std::string& path() const { return path_; }

private:
    UpstreamClient client_;
    std::string path_;
    int okStatusMin_;
    int okStatusMax_;
};

} // namespace upstream
} // namespace gateway
