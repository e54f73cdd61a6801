#include "gateway/ProxyGateway.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"

#include <chrono>
#include <cstdio>

namespace gateway {

using gateway::protocol::HeaderList;
using gateway::protocol::HttpRequest;
using gateway::protocol::HttpResponse;
using gateway::protocol::IEquals;
using gateway::upstream::UpstreamRequest;
using gateway::upstream::UpstreamResult;

namespace {

const char* const kHopByHopHeaders[] = {
    "Connection", "Keep-Alive", "Proxy-Connection", "Transfer-Encoding",
    "Content-Length", "TE", "Upgrade", "Trailer",
};

bool IsHopByHop(const std::string& name) {
    for (const char* h : kHopByHopHeaders) {
        if (IEquals(name, h)) return true;
    }
    return false;
}

gateway::network::InetAddress WorkerAddress(uint16_t port) {
    return gateway::network::InetAddress("127.0.0.1", port);
}

} // namespace

ProxyGateway::ProxyGateway(gateway::network::EventLoop* loop, const GatewayConfig& config)
    : config_(config),
      server_(loop, gateway::network::InetAddress(config.listenHost, config.listenPort), "Gateway"),
      upstream_(loop, config.connectTimeoutSec, config.requestTimeoutSec) {
    server_.setMaxBodyBytes(config_.maxBodyBytes);
    server_.setHttpCallback([this](const HttpRequest& req, ResponseCallback done) {
        HandleRequest(req, std::move(done));
    });
}

ProxyGateway::~ProxyGateway() = default;

bool ProxyGateway::Start() {
    if (config_.tlsEnabled && !server_.tcpServer().EnableTls(config_.tlsCertPath, config_.tlsKeyPath)) {
        LOG_ERROR << "Cannot load TLS certificate " << config_.tlsCertPath << " / key " << config_.tlsKeyPath;
        return false;
    }
    server_.tcpServer().SetIdleTimeout(config_.idleTimeoutSec);
    if (!server_.start()) {
        LOG_ERROR << "Cannot listen on " << config_.listenHost << ":" << config_.listenPort;
        return false;
    }
    LOG_INFO << "Gateway listening on " << config_.listenHost << ":" << config_.listenPort
             << ", forwarding " << config_.apiPrefix << "/* to 127.0.0.1:" << WorkerPort();
    return true;
}

size_t ProxyGateway::connectionCount() const {
    return server_.connectionCount();
}

uint16_t ProxyGateway::WorkerPort() const {
    return worker_ ? worker_->port() : config_.workerPort;
}

bool ProxyGateway::WorkerRunning() const {
    return worker_ && worker_->alive();
}

bool ProxyGateway::MatchesPrefix(const std::string& path, const std::string& prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::string ProxyGateway::BuildUpstreamUrl(const std::string& base, const std::string& path, const std::string& query) {
    std::string url = base + path;
    if (!query.empty()) {
        url += '?';
        url += query;
    }
    return url;
}

HeaderList ProxyGateway::FilterRequestHeaders(const HeaderList& headers) {
    HeaderList out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        if (IEquals(h.first, "Host") || IsHopByHop(h.first)) continue;
        out.push_back(h);
    }
    return out;
}

HeaderList ProxyGateway::FilterResponseHeaders(const HeaderList& headers) {
    HeaderList out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        if (IsHopByHop(h.first)) continue;
        out.push_back(h);
    }
    return out;
}

bool ProxyGateway::ForwardsBody(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

std::string ProxyGateway::JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof buf, "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

void ProxyGateway::HandleRequest(const HttpRequest& req, ResponseCallback done) {
    const auto started = std::chrono::steady_clock::now();
    const std::string line = std::string(req.methodString()) + " " + req.path();
    const std::string origin = config_.corsEnabled ? req.getHeader("Origin") : std::string();

    ResponseCallback finish = [this, done, line, started, origin](HttpResponse&& response) {
        if (!origin.empty() && OriginAllowed(origin)) {
            ApplyCors(origin, &response);
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - started).count();
        LOG_INFO << line << " -> " << response.statusCode() << " (" << ms << " ms)";
        done(std::move(response));
    };

    if (IsPreflight(req)) {
        AnswerPreflight(req, std::move(finish));
        return;
    }
    Dispatch(req, std::move(finish));
}

void ProxyGateway::Dispatch(const HttpRequest& req, ResponseCallback done) {
    if (req.path() == config_.healthPath) {
        HandleLiveness(req, std::move(done));
        return;
    }

    if (!MatchesPrefix(req.path(), config_.apiPrefix)) {
        HttpResponse response;
        response.setJsonBody(HttpResponse::k404NotFound, "{\"detail\":\"Not Found\"}");
        done(std::move(response));
        return;
    }

    switch (req.getMethod()) {
        case HttpRequest::kGet:
        case HttpRequest::kPost:
        case HttpRequest::kPut:
        case HttpRequest::kDelete:
        case HttpRequest::kPatch:
        case HttpRequest::kOptions:
            Forward(req, std::move(done));
            return;
        default: {
            HttpResponse response;
            response.setJsonBody(HttpResponse::k405MethodNotAllowed, "{\"detail\":\"Method Not Allowed\"}");
            response.setHeader("Allow", "GET, POST, PUT, DELETE, PATCH, OPTIONS");
            done(std::move(response));
            return;
        }
    }
}

void ProxyGateway::HandleLiveness(const HttpRequest& req, ResponseCallback done) {
    HttpResponse response;
    if (req.getMethod() != HttpRequest::kGet && req.getMethod() != HttpRequest::kHead) {
        response.setJsonBody(HttpResponse::k405MethodNotAllowed, "{\"detail\":\"Method Not Allowed\"}");
        response.setHeader("Allow", "GET, HEAD");
        done(std::move(response));
        return;
    }
    response.setJsonBody(HttpResponse::k200Ok,
                         std::string("{\"ok\":true,\"proxy\":true,\"worker_port\":") + std::to_string(WorkerPort()) +
                             ",\"worker_running\":" + (WorkerRunning() ? "true" : "false") + "}");
    done(std::move(response));
}

void ProxyGateway::Forward(const HttpRequest& req, ResponseCallback done) {
    const uint16_t port = WorkerPort();
    const std::string base = "http://127.0.0.1:" + std::to_string(port);
    const std::string url = BuildUpstreamUrl(base, req.path(), req.query());

    UpstreamRequest request;
    request.method = req.methodString();
    request.target = req.query().empty() ? req.path() : req.path() + "?" + req.query();
    request.headers = FilterRequestHeaders(req.headers());
    if (ForwardsBody(request.method)) {
        request.body = req.body();
    }

    upstream_.Send(WorkerAddress(port), std::move(request), [done, url](UpstreamResult&& result) {
        HttpResponse response;
        if (result.outcome == UpstreamResult::kUnreachable) {
            LOG_WARN << "Worker unreachable for " << url << ": " << result.description;
            response.setJsonBody(HttpResponse::k503ServiceUnavailable,
                                 "{\"error\":\"worker not ready\",\"url\":\"" + JsonEscape(url) + "\"}");
        } else if (result.outcome == UpstreamResult::kFault) {
            LOG_ERROR << "Upstream failure for " << url << ": " << result.description;
            response.setJsonBody(HttpResponse::k500InternalServerError,
                                 "{\"error\":\"" + JsonEscape(result.description) + "\",\"url\":\"" +
                                     JsonEscape(url) + "\"}");
        } else {
            response.setStatusCode(result.statusCode);
            if (!result.reason.empty()) response.setStatusMessage(result.reason);
            for (const auto& h : FilterResponseHeaders(result.headers)) {
                response.addHeader(h.first, h.second);
            }
            response.setBody(result.body);
        }
        done(std::move(response));
    });
}

bool ProxyGateway::IsPreflight(const HttpRequest& req) const {
    return config_.corsEnabled && req.getMethod() == HttpRequest::kOptions && req.hasHeader("Origin") &&
           req.hasHeader("Access-Control-Request-Method");
}

bool ProxyGateway::OriginAllowed(const std::string& origin) const {
    for (const auto& allowed : config_.corsAllowOrigins) {
        if (allowed == "*" || allowed == origin) return true;
    }
    return false;
}

void ProxyGateway::AnswerPreflight(const HttpRequest& req, ResponseCallback done) {
    const std::string origin = req.getHeader("Origin");
    HttpResponse response;
    if (!OriginAllowed(origin)) {
        response.setStatusCode(HttpResponse::k400BadRequest);
        response.setContentType("text/plain; charset=utf-8");
        response.setBody("Disallowed CORS origin");
        done(std::move(response));
        return;
    }
    response.setStatusCode(HttpResponse::k200Ok);
    response.setContentType("text/plain; charset=utf-8");
    response.setBody("OK");
    response.setHeader("Access-Control-Allow-Methods", config_.corsAllowMethods);
    std::string allowHeaders = config_.corsAllowHeaders;
    if (allowHeaders == "*") {
        allowHeaders = req.getHeader("Access-Control-Request-Headers");
    }
    if (!allowHeaders.empty()) {
        response.setHeader("Access-Control-Allow-Headers", allowHeaders);
    }
    response.setHeader("Access-Control-Max-Age", std::to_string(config_.corsMaxAgeSec));
    done(std::move(response));
}

void ProxyGateway::ApplyCors(const std::string& origin, HttpResponse* response) const {
    bool wildcard = false;
    for (const auto& allowed : config_.corsAllowOrigins) {
        if (allowed == "*") wildcard = true;
    }
    if (wildcard && !config_.corsAllowCredentials) {
        response->setHeader("Access-Control-Allow-Origin", "*");
    } else {
        response->setHeader("Access-Control-Allow-Origin", origin);
        const std::string vary = response->getHeader("Vary");
        if (vary.empty()) {
            response->setHeader("Vary", "Origin");
        } else if (!gateway::protocol::HeaderHasToken(vary, "Origin")) {
            response->setHeader("Vary", vary + ", Origin");
        }
    }
    if (config_.corsAllowCredentials) {
        response->setHeader("Access-Control-Allow-Credentials", "true");
    }
}

} // namespace gateway
