#pragma once

#include "gateway/GatewayConfig.h"
#include "gateway/common/noncopyable.h"
#include "gateway/protocol/HttpServer.h"
#include "gateway/supervisor/WorkerProcess.h"
#include "gateway/upstream/UpstreamClient.h"

#include <string>

namespace gateway {

namespace network {
class EventLoop;
} // namespace network

namespace protocol {
class HttpRequest;
class HttpResponse;
} // namespace protocol

// Public HTTP surface. Answers the liveness path itself and forwards every
// request under the API prefix to the worker on loopback, one upstream
// attempt per request.
class ProxyGateway : gateway::common::noncopyable {
public:
    using ResponseCallback = gateway::protocol::HttpServer::ResponseCallback;

    ProxyGateway(gateway::network::EventLoop* loop, const GatewayConfig& config);
    ~ProxyGateway();

    // Read-only view of the worker, used for its port and the liveness body.
    // Without one the configured worker port is used.
    void SetWorker(supervisor::ConstWorkerProcessPtr worker) { worker_ = std::move(worker); }

    // Binds the listener. False when the port is taken or TLS setup failed.
    bool Start();

    void HandleRequest(const gateway::protocol::HttpRequest& req, ResponseCallback done);

    const GatewayConfig& config() const { return config_; }
    size_t upstreamInFlight() const { return upstream_.inFlight(); }
    size_t connectionCount() const;

    // path == prefix, or path starts with prefix + "/".
    static bool MatchesPrefix(const std::string& path, const std::string& prefix);
    static std::string BuildUpstreamUrl(const std::string& base, const std::string& path, const std::string& query);
    // Drops Host and the hop-by-hop/framing fields the gateway regenerates.
    static gateway::protocol::HeaderList FilterRequestHeaders(const gateway::protocol::HeaderList& headers);
    static gateway::protocol::HeaderList FilterResponseHeaders(const gateway::protocol::HeaderList& headers);
    static bool ForwardsBody(const std::string& method);
    static std::string JsonEscape(const std::string& s);

private:
    void Dispatch(const gateway::protocol::HttpRequest& req, ResponseCallback done);
    void HandleLiveness(const gateway::protocol::HttpRequest& req, ResponseCallback done);
    void Forward(const gateway::protocol::HttpRequest& req, ResponseCallback done);

    bool IsPreflight(const gateway::protocol::HttpRequest& req) const;
    void AnswerPreflight(const gateway::protocol::HttpRequest& req, ResponseCallback done);
    void ApplyCors(const std::string& origin, gateway::protocol::HttpResponse* response) const;
    bool OriginAllowed(const std::string& origin) const;

    uint16_t WorkerPort() const;
    bool WorkerRunning() const;

    const GatewayConfig config_;
    gateway::protocol::HttpServer server_;
    supervisor::ConstWorkerProcessPtr worker_;
    // Destroyed first: pending upstream callbacks are dropped with it.
    upstream::UpstreamClient upstream_;
};

} // namespace gateway
