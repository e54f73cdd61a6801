#include "gateway/ProxyGateway.h"
#include "gateway/GatewayConfig.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"
#include "gateway/protocol/HttpServer.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/network/Timer.h"
#include "gateway/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace gateway;
using protocol::HttpRequest;
using protocol::HttpResponse;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

// One request on a fresh connection; returns the raw response.
static std::string exchange(uint16_t port, const std::string& request) {
    int fd = connectTo(port);
    size_t off = 0;
    while (off < request.size()) {
        ssize_t n = ::send(fd, request.data() + off, request.size() - off, 0);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
    std::string resp = recvUntilClose(fd);
    ::close(fd);
    return resp;
}

static int statusOf(const std::string& resp) {
    assert(resp.compare(0, 9, "HTTP/1.1 ") == 0);
    return std::atoi(resp.c_str() + 9);
}

static std::string bodyOf(const std::string& resp) {
    size_t pos = resp.find("\r\n\r\n");
    assert(pos != std::string::npos);
    return resp.substr(pos + 4);
}

static bool hasHeader(const std::string& resp, const std::string& line) {
    const std::string head = resp.substr(0, resp.find("\r\n\r\n") + 2);
    return head.find("\r\n" + line + "\r\n") != std::string::npos;
}

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);

    GatewayConfig config;
    config.listenHost = "127.0.0.1";
    config.listenPort = pickFreePort();
    config.workerPort = pickFreePort();
    config.requestTimeoutSec = 3.0;
    config.connectTimeoutSec = 1.0;
    config.corsAllowOrigins = {"http://app.example"};
    config.corsAllowCredentials = true;

    network::EventLoop loop;

    // Stand-in worker: echoes what it received and records every request.
    std::vector<HttpRequest> received;
    protocol::HttpServer worker(&loop, network::InetAddress(config.workerPort, true), "FakeWorker");
    worker.setHttpCallback([&](const HttpRequest& req, protocol::HttpServer::ResponseCallback done) {
        received.push_back(req);
        HttpResponse resp;
        if (req.path() == "/api/missing") {
            resp.setJsonBody(404, "{\"detail\":\"no such item\"}");
        } else {
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setContentType("text/plain");
            resp.addHeader("X-Worker", "fake");
            resp.addHeader("Set-Cookie", "a=1");
            resp.addHeader("Set-Cookie", "b=2");
            resp.setBody(std::string(req.methodString()) + " " + req.path() + "?" + req.query() +
                         " body=" + req.body());
        }
        done(std::move(resp));
    });
    assert(worker.start());

    ProxyGateway gateway(&loop, config);
    auto handle = std::make_shared<supervisor::WorkerProcess>(std::vector<std::string>{"worker"},
                                                              config.workerPort,
                                                              std::map<std::string, std::string>());
    gateway.SetWorker(handle);
    assert(gateway.Start());

    const uint16_t port = config.listenPort;
    std::vector<std::string> failures;
    std::thread client([&]() {
        // GET with query: status, headers and body pass through, Host does not.
        std::string r = exchange(port,
                                 "GET /api/items?limit=5&sort=asc HTTP/1.1\r\n"
                                 "Host: public.example\r\n"
                                 "X-Request-Id: 42\r\n"
                                 "Connection: close\r\n"
                                 "\r\n");
        assert(statusOf(r) == 200);
        assert(bodyOf(r) == "GET /api/items?limit=5&sort=asc body=");
        assert(hasHeader(r, "X-Worker: fake"));
        assert(hasHeader(r, "Set-Cookie: a=1"));
        assert(hasHeader(r, "Set-Cookie: b=2"));

        // POST forwards the body.
        r = exchange(port,
                     "POST /api/items HTTP/1.1\r\n"
                     "Host: public.example\r\n"
                     "Content-Type: application/json\r\n"
                     "Content-Length: 11\r\n"
                     "Connection: close\r\n"
                     "\r\n"
                     "{\"name\":1}\n");
        assert(statusOf(r) == 200);
        assert(bodyOf(r) == "POST /api/items? body={\"name\":1}\n");

        // DELETE drops the body.
        r = exchange(port,
                     "DELETE /api/items/7 HTTP/1.1\r\n"
                     "Content-Length: 4\r\n"
                     "Connection: close\r\n"
                     "\r\n"
                     "junk");
        assert(statusOf(r) == 200);
        assert(bodyOf(r) == "DELETE /api/items/7? body=");

        // The prefix itself is forwarded; worker errors come back unchanged.
        r = exchange(port, "GET /api HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 200);
        r = exchange(port, "GET /api/missing HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 404);
        assert(bodyOf(r) == "{\"detail\":\"no such item\"}");

        // Liveness is answered locally.
        r = exchange(port, "GET /health HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 200);
        assert(bodyOf(r) == "{\"ok\":true,\"proxy\":true,\"worker_port\":" + std::to_string(config.workerPort) +
                                ",\"worker_running\":false}");
        r = exchange(port, "HEAD /health HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 200);
        assert(bodyOf(r).empty());
        r = exchange(port, "POST /health HTTP/1.1\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 405);
        assert(hasHeader(r, "Allow: GET, HEAD"));

        // Outside the prefix.
        r = exchange(port, "GET /apiary HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 404);
        assert(bodyOf(r) == "{\"detail\":\"Not Found\"}");
        r = exchange(port, "GET / HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 404);

        // Methods the gateway does not forward.
        r = exchange(port, "PROPFIND /api/items HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 405);
        assert(bodyOf(r) == "{\"detail\":\"Method Not Allowed\"}");

        // CORS on a forwarded response.
        r = exchange(port,
                     "GET /api/items HTTP/1.1\r\n"
                     "Origin: http://app.example\r\n"
                     "Connection: close\r\n"
                     "\r\n");
        assert(statusOf(r) == 200);
        assert(hasHeader(r, "Access-Control-Allow-Origin: http://app.example"));
        assert(hasHeader(r, "Access-Control-Allow-Credentials: true"));
        assert(hasHeader(r, "Vary: Origin"));

        // Unknown origin gets no CORS headers.
        r = exchange(port,
                     "GET /api/items HTTP/1.1\r\n"
                     "Origin: http://evil.example\r\n"
                     "Connection: close\r\n"
                     "\r\n");
        assert(statusOf(r) == 200);
        assert(r.find("Access-Control-Allow-Origin") == std::string::npos);

        // Preflight is answered without reaching the worker.
        r = exchange(port,
                     "OPTIONS /api/items HTTP/1.1\r\n"
                     "Origin: http://app.example\r\n"
                     "Access-Control-Request-Method: PUT\r\n"
                     "Access-Control-Request-Headers: content-type, x-token\r\n"
                     "Connection: close\r\n"
                     "\r\n");
        assert(statusOf(r) == 200);
        assert(hasHeader(r, "Access-Control-Allow-Methods: GET, POST, PUT, DELETE, PATCH, OPTIONS"));
        assert(hasHeader(r, "Access-Control-Allow-Headers: content-type, x-token"));
        assert(hasHeader(r, "Access-Control-Max-Age: 600"));
        assert(hasHeader(r, "Access-Control-Allow-Origin: http://app.example"));

        r = exchange(port,
                     "OPTIONS /api/items HTTP/1.1\r\n"
                     "Origin: http://evil.example\r\n"
                     "Access-Control-Request-Method: PUT\r\n"
                     "Connection: close\r\n"
                     "\r\n");
        assert(statusOf(r) == 400);
        assert(bodyOf(r) == "Disallowed CORS origin");

        // A plain OPTIONS is not a preflight and goes to the worker.
        r = exchange(port, "OPTIONS /api/items HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 200);
        assert(bodyOf(r) == "OPTIONS /api/items? body=");

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    network::Timer guard(&loop, [&]() {
        LOG_ERROR << "Gateway forward test timed out";
        std::abort();
    });
    guard.Start(20.0);
    loop.Loop();
    client.join();

    // GET, POST, DELETE, /api, /api/missing, CORS x2, plain OPTIONS.
    assert(received.size() == 8);
    const HttpRequest& first = received[0];
    assert(first.path() == "/api/items");
    assert(first.query() == "limit=5&sort=asc");
    assert(first.getHeader("X-Request-Id") == "42");
    assert(first.getHeader("Host") == "127.0.0.1:" + std::to_string(config.workerPort));
    assert(received[1].getHeader("Content-Type") == "application/json");
    assert(received[1].getHeader("Content-Length") == "11");
    assert(received[2].body().empty());
    assert(!received[2].hasHeader("Content-Length"));
    assert(received[5].getHeader("Origin") == "http://app.example");
    assert(gateway.upstreamInFlight() == 0);

    LOG_INFO << "Gateway forward PASS";
    return 0;
}
