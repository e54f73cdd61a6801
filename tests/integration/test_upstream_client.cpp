#include "gateway/upstream/UpstreamClient.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"
#include "gateway/protocol/HttpServer.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/network/Timer.h"
#include "gateway/common/Logger.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <csignal>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

using namespace gateway;
using upstream::UpstreamClient;
using upstream::UpstreamRequest;
using upstream::UpstreamResult;

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

// Blocking loopback listener for peers that misbehave on purpose.
static int listenOn(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(fd, 16) == 0);
    return fd;
}

static std::string readRequestHead(int fd) {
    std::string in;
    char buf[4096];
    while (in.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        in.append(buf, buf + n);
    }
    return in;
}

// Accepts one connection on a thread, reads the request head and hands the
// socket to `act`, then closes it.
static std::thread serveOnce(int listenFd, std::function<void(int fd, const std::string& head)> act) {
    return std::thread([listenFd, act]() {
        int fd = ::accept(listenFd, nullptr, nullptr);
        assert(fd >= 0);
        const std::string head = readRequestHead(fd);
        act(fd, head);
        ::close(fd);
    });
}

static void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

// Sends one request and runs the loop until its callback fires.
static UpstreamResult roundTrip(network::EventLoop& loop, UpstreamClient& client, uint16_t port,
                                UpstreamRequest request) {
    UpstreamResult got;
    bool called = false;
    client.Send(network::InetAddress("127.0.0.1", port), std::move(request), [&](UpstreamResult&& r) {
        got = std::move(r);
        called = true;
        loop.Quit();
    });
    assert(!called);
    assert(client.inFlight() == 1);
    network::Timer guard(&loop, [&]() { loop.Quit(); });
    guard.Start(5.0);
    loop.Loop();
    assert(called);
    assert(client.inFlight() == 0);
    return got;
}

void testOkAgainstHttpServer(network::EventLoop& loop, UpstreamClient& client) {
    const uint16_t port = pickFreePort();
    protocol::HttpServer worker(&loop, network::InetAddress(port, true), "FakeWorker");
    protocol::HttpRequest seen;
    worker.setHttpCallback([&](const protocol::HttpRequest& req, protocol::HttpServer::ResponseCallback done) {
        seen = req;
        protocol::HttpResponse resp;
        resp.setStatusCode(201);
        resp.setStatusMessage("Created Thing");
        resp.setContentType("application/json");
        resp.addHeader("X-Worker", "yes");
        resp.setBody("{\"echo\":\"" + req.body() + "\"}");
        done(std::move(resp));
    });
    assert(worker.start());

    UpstreamRequest req;
    req.method = "POST";
    req.target = "/api/items?limit=5";
    req.headers.emplace_back("X-Trace", "abc");
    req.headers.emplace_back("Content-Length", "999");
    req.body = "payload";
    UpstreamResult r = roundTrip(loop, client, port, req);

    assert(r.ok());
    assert(r.statusCode == 201);
    assert(r.reason == "Created Thing");
    assert(r.body == "{\"echo\":\"payload\"}");
    assert(protocol::FindHeader(r.headers, "X-Worker") && *protocol::FindHeader(r.headers, "X-Worker") == "yes");

    assert(seen.methodString() == std::string("POST"));
    assert(seen.path() == "/api/items");
    assert(seen.query() == "limit=5");
    assert(seen.getHeader("Host") == "127.0.0.1:" + std::to_string(port));
    assert(seen.getHeader("Content-Length") == "7");
    assert(seen.getHeader("X-Trace") == "abc");
    assert(seen.body() == "payload");
    LOG_INFO << "Upstream ok PASS";
}

void testRefusedIsUnreachable(network::EventLoop& loop, UpstreamClient& client) {
    UpstreamResult r = roundTrip(loop, client, pickFreePort(), UpstreamRequest());
    assert(r.outcome == UpstreamResult::kUnreachable);
    assert(r.description == "connection refused");
    LOG_INFO << "Upstream refused PASS";
}

void testChunkedAndReadUntilClose(network::EventLoop& loop, UpstreamClient& client) {
    const uint16_t port = pickFreePort();
    int lfd = listenOn(port);

    std::thread peer = serveOnce(lfd, [](int fd, const std::string& head) {
        assert(head.find("Connection: close\r\n") != std::string::npos);
        sendAll(fd, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
    });
    UpstreamResult r = roundTrip(loop, client, port, UpstreamRequest());
    peer.join();
    assert(r.ok());
    assert(r.body == "hello world");

    peer = serveOnce(lfd, [](int fd, const std::string&) {
        sendAll(fd, "HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nuntil close");
    });
    r = roundTrip(loop, client, port, UpstreamRequest());
    peer.join();
    assert(r.ok());
    assert(r.body == "until close");

    ::close(lfd);
    LOG_INFO << "Upstream chunked/read-until-close PASS";
}

void testFaults(network::EventLoop& loop, UpstreamClient& client) {
    const uint16_t port = pickFreePort();
    int lfd = listenOn(port);

    std::thread peer = serveOnce(lfd, [](int, const std::string&) {});
    UpstreamResult r = roundTrip(loop, client, port, UpstreamRequest());
    peer.join();
    assert(r.outcome == UpstreamResult::kFault);
    assert(!r.description.empty());

    peer = serveOnce(lfd, [](int fd, const std::string&) { sendAll(fd, "SPDY/9 what\r\n\r\n"); });
    r = roundTrip(loop, client, port, UpstreamRequest());
    peer.join();
    assert(r.outcome == UpstreamResult::kFault);
    assert(r.description.find("malformed response") == 0);

    peer = serveOnce(lfd, [](int fd, const std::string&) {
        sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort");
    });
    r = roundTrip(loop, client, port, UpstreamRequest());
    peer.join();
    assert(r.outcome == UpstreamResult::kFault);
    ::close(lfd);
    LOG_INFO << "Upstream faults PASS";
}

void testSilentWorkerTimesOut(network::EventLoop& loop) {
    UpstreamClient client(&loop, 1.0, 0.3);
    const uint16_t port = pickFreePort();
    int lfd = listenOn(port);
    std::thread peer = serveOnce(lfd, [](int, const std::string&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(800));
    });

    const auto start = std::chrono::steady_clock::now();
    UpstreamResult r = roundTrip(loop, client, port, UpstreamRequest());
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    peer.join();
    ::close(lfd);

    assert(r.outcome == UpstreamResult::kFault);
    assert(r.description == "worker did not answer within 0.3s");
    assert(took >= 0.25 && took < 0.8);
    LOG_INFO << "Upstream request timeout PASS";
}

void testDestroyDropsCallbacks(network::EventLoop& loop) {
    bool called = false;
    {
        UpstreamClient client(&loop, 1.0, 1.0);
        client.Send(network::InetAddress("127.0.0.1", pickFreePort()), UpstreamRequest(),
                    [&](UpstreamResult&&) { called = true; });
    }
    network::Timer guard(&loop, [&]() { loop.Quit(); });
    guard.Start(0.2);
    loop.Loop();
    assert(!called);
    LOG_INFO << "Upstream destroy drops callbacks PASS";
}

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);
    network::EventLoop loop;
    UpstreamClient client(&loop, 1.0, 5.0);
    testOkAgainstHttpServer(loop, client);
    testRefusedIsUnreachable(loop, client);
    testChunkedAndReadUntilClose(loop, client);
    testFaults(loop, client);
    testSilentWorkerTimesOut(loop);
    testDestroyDropsCallbacks(loop);
    return 0;
}
