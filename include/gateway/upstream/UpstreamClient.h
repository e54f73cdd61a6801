#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/InetAddress.h"
#include "gateway/protocol/HttpHeaders.h"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace gateway {

namespace network {
class EventLoop;
} // namespace network

namespace upstream {

// One outbound HTTP/1.1 request. The client adds Host, Content-Length and
// Connection: close itself.
struct UpstreamRequest {
    std::string method{"GET"};
    // Origin-form target: path plus "?query" when there is one.
    std::string target{"/"};
    gateway::protocol::HeaderList headers;
    std::string body;
};

struct UpstreamResult {
    enum Outcome {
        kOk,
        // Nothing accepted the connection: refused, unreachable, connect timeout.
        kUnreachable,
        // Connected, then something went wrong: reset, bad response, timeout.
        kFault,
    };

    Outcome outcome{kFault};
    std::string description;

    int statusCode{0};
    std::string reason;
    gateway::protocol::HeaderList headers;
    std::string body;

    bool ok() const { return outcome == kOk; }
    static const char* OutcomeName(Outcome o);
};

class UpstreamCall;

// Non-blocking HTTP client for loopback peers, one connection per request.
// Each Send gets exactly one callback, on the loop thread, unless the client
// is destroyed first.
class UpstreamClient : gateway::common::noncopyable {
public:
    using Callback = std::function<void(UpstreamResult&&)>;

    UpstreamClient(gateway::network::EventLoop* loop, double connectTimeoutSec, double requestTimeoutSec);
    // Drops every call in flight without running its callback.
    ~UpstreamClient();

    void Send(const gateway::network::InetAddress& addr, UpstreamRequest request, Callback cb);

    size_t inFlight() const { return calls_.size(); }
    gateway::network::EventLoop* getLoop() const { return loop_; }

    static std::string SerializeRequest(const UpstreamRequest& request, const std::string& hostHeader);

private:
    friend class UpstreamCall;
    void Forget(uint64_t id);

    gateway::network::EventLoop* loop_;
    double connectTimeoutSec_;
    double requestTimeoutSec_;
    uint64_t nextId_{1};
    std::map<uint64_t, std::shared_ptr<UpstreamCall>> calls_;
};

} // namespace upstream
} // namespace gateway
