#include "gateway/upstream/HttpHealthChecker.h"
#include "gateway/common/Logger.h"

namespace gateway {
namespace upstream {

HttpHealthChecker::HttpHealthChecker(gateway::network::EventLoop* loop,
                                     double timeoutSec,
                                     std::string path,
                                     int okStatusMin,
                                     int okStatusMax)
    : HealthChecker(loop),
      client_(loop, timeoutSec, timeoutSec),
      path_(std::move(path)),
      okStatusMin_(okStatusMin),
      okStatusMax_(okStatusMax) {
}

void HttpHealthChecker::Check(const gateway::network::InetAddress& addr, CheckCallback cb) {
    UpstreamRequest request;
    request.method = "GET";
    request.target = path_;
    request.headers.emplace_back("Accept", "application/json");

    const int okMin = okStatusMin_;
    const int okMax = okStatusMax_;
    const std::string target = addr.toIpPort() + path_;
    client_.Send(addr, std::move(request), [cb, okMin, okMax, target](UpstreamResult&& result) {
        if (!result.ok()) {
            LOG_DEBUG << "Health check " << target << " failed: " << result.description;
            if (cb) cb(false, result.description);
            return;
        }
        const bool healthy = result.statusCode >= okMin && result.statusCode <= okMax;
        if (cb) cb(healthy, "status " + std::to_string(result.statusCode));
    });
}

} // namespace upstream
} // namespace gateway
