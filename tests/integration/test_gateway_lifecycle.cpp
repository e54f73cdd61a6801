#include "gateway/GatewayApp.h"
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
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits.h>
#include <string>
#include <thread>
#include <vector>

using namespace gateway;
using protocol::HttpRequest;
using protocol::HttpResponse;

static std::string envOr(const char* name, const char* def) {
    const char* v = ::getenv(name);
    return v ? v : def;
}

// Child mode: a small HTTP worker on $PORT.
static int runWorker() {
    const int port = std::atoi(envOr("PORT", "0").c_str());
    if (port <= 0) return 2;
    network::EventLoop loop;
    protocol::HttpServer server(&loop, network::InetAddress(static_cast<uint16_t>(port), true), "Worker");
    server.setHttpCallback([](const HttpRequest& req, protocol::HttpServer::ResponseCallback done) {
        if (req.path() == "/api/crash") {
            ::_exit(3);
        }
        HttpResponse resp;
        if (req.path() == "/api/health") {
            resp.setJsonBody(200, "{\"status\":\"ok\"}");
        } else if (req.path() == "/api/env") {
            resp.setStatusCode(200);
            resp.setContentType("text/plain");
            resp.setBody("PORT=" + envOr("PORT", "") + ";MINIMAL_BOOT=" + envOr("MINIMAL_BOOT", "") +
                         ";FRACTAL_ENABLED=" + envOr("FRACTAL_ENABLED", "") + ";EXTRA=" + envOr("EXTRA", ""));
        } else {
            resp.setJsonBody(404, "{\"detail\":\"Not Found\"}");
        }
        done(std::move(resp));
    });
    if (!server.start()) return 2;
    std::printf("worker listening on %d\n", port);
    std::fflush(stdout);
    loop.Loop();
    return 0;
}

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

static std::string selfPath() {
    char buf[PATH_MAX];
    const ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    assert(n > 0);
    buf[n] = '\0';
    return buf;
}

static GatewayConfig baseConfig() {
    GatewayConfig config;
    config.listenHost = "127.0.0.1";
    config.listenPort = pickFreePort();
    config.workerPort = pickFreePort();
    config.workerArgv = {selfPath(), "--worker"};
    config.workerCwd = "/tmp";
    config.workerExtraEnv = {{"EXTRA", "x1"}};
    config.readinessMaxWaitSec = 10.0;
    config.readinessInitialBackoffSec = 0.05;
    config.readinessMaxBackoffSec = 0.2;
    config.terminateTimeoutSec = 2.0;
    config.connectTimeoutSec = 1.0;
    config.requestTimeoutSec = 5.0;
    return config;
}

void testServeAndShutdown(bool probe) {
    GatewayConfig config = baseConfig();
    config.readinessProbe = probe;
    config.readinessGraceSec = 0.5;

    network::EventLoop loop;
    GatewayApp app(&loop, config);
    bool started = false;
    std::thread client;
    pid_t pid = -1;

    app.Start([&](bool ok) {
        assert(ok);
        started = true;
        assert(app.phase() == GatewayApp::kServing);
        assert(app.worker()->state() == supervisor::WorkerProcess::kRunning);
        pid = app.worker()->pid();

        client = std::thread([&]() {
            const uint16_t port = config.listenPort;
            std::string r = exchange(port, "GET /api/env HTTP/1.1\r\nConnection: close\r\n\r\n");
            assert(statusOf(r) == 200);
            assert(bodyOf(r) == "PORT=" + std::to_string(config.workerPort) +
                                    ";MINIMAL_BOOT=1;FRACTAL_ENABLED=true;EXTRA=x1");

            r = exchange(port, "GET /health HTTP/1.1\r\nConnection: close\r\n\r\n");
            assert(statusOf(r) == 200);
            assert(bodyOf(r).find("\"worker_running\":true") != std::string::npos);

            loop.QueueInLoop([&]() { app.Shutdown([&]() { loop.Quit(); }); });
        });
    });
    assert(app.phase() == GatewayApp::kStarting);

    network::Timer guard(&loop, [&]() {
        LOG_ERROR << "Lifecycle test timed out";
        std::abort();
    });
    guard.Start(30.0);
    loop.Loop();
    client.join();

    assert(started);
    assert(app.phase() == GatewayApp::kStopped);
    assert(app.worker()->state() == supervisor::WorkerProcess::kExited);
    // Reaped: no such child any more.
    assert(::kill(pid, 0) != 0 && errno == ESRCH);
    LOG_INFO << "Lifecycle serve/shutdown (probe=" << probe << ") PASS";
}

void testStartupFailures() {
    struct Case {
        const char* name;
        std::vector<std::string> argv;
        double maxWaitSec;
    };
    const Case cases[] = {
        {"missing binary", {"/nonexistent/worker-binary"}, 10.0},
        {"worker exits during startup", {"/bin/sh", "-c", "echo booting; exit 7"}, 10.0},
        {"never ready", {"/bin/sh", "-c", "exec sleep 30"}, 0.5},
    };
    for (const Case& c : cases) {
        GatewayConfig config = baseConfig();
        config.workerArgv = c.argv;
        config.readinessMaxWaitSec = c.maxWaitSec;

        network::EventLoop loop;
        GatewayApp app(&loop, config);
        int calls = 0;
        bool result = true;
        const auto t0 = std::chrono::steady_clock::now();
        app.Start([&](bool ok) {
            ++calls;
            result = ok;
            loop.Quit();
        });
        network::Timer guard(&loop, [&]() {
            LOG_ERROR << "Startup failure case timed out: " << c.name;
            std::abort();
        });
        guard.Start(10.0);
        loop.Loop();
        const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

        assert(calls == 1);
        assert(!result);
        assert(app.phase() == GatewayApp::kStopped);
        assert(!app.worker() || !app.worker()->alive());
        assert(took < 5.0);
        // The public port was never bound.
        assert(app.gateway().connectionCount() == 0);
        LOG_INFO << "Lifecycle startup failure '" << c.name << "' PASS";
    }
}

void testWorkerDiesWhileServing() {
    GatewayConfig config = baseConfig();
    network::EventLoop loop;
    GatewayApp app(&loop, config);
    std::thread client;

    app.Start([&](bool ok) {
        assert(ok);
        client = std::thread([&]() {
            const uint16_t port = config.listenPort;
            std::string r = exchange(port, "GET /api/crash HTTP/1.1\r\nConnection: close\r\n\r\n");
            assert(statusOf(r) == 500);

            // The gateway keeps serving; liveness reports the dead worker.
            bool sawDown = false;
            for (int i = 0; i < 200 && !sawDown; ++i) {
                r = exchange(port, "GET /health HTTP/1.1\r\nConnection: close\r\n\r\n");
                assert(statusOf(r) == 200);
                sawDown = bodyOf(r).find("\"worker_running\":false") != std::string::npos;
                if (!sawDown) std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            assert(sawDown);

            r = exchange(port, "GET /api/env HTTP/1.1\r\nConnection: close\r\n\r\n");
            assert(statusOf(r) == 503);

            loop.QueueInLoop([&]() { app.Shutdown([&]() { loop.Quit(); }); });
        });
    });

    network::Timer guard(&loop, [&]() {
        LOG_ERROR << "Worker death test timed out";
        std::abort();
    });
    guard.Start(30.0);
    loop.Loop();
    client.join();
    assert(app.worker()->exitDescription() == "exited with code 3");
    assert(app.phase() == GatewayApp::kStopped);
    LOG_INFO << "Lifecycle worker death PASS";
}

void testShutdownDuringStartup() {
    GatewayConfig config = baseConfig();
    config.workerArgv = {"/bin/sh", "-c", "exec sleep 30"};

    network::EventLoop loop;
    GatewayApp app(&loop, config);
    bool startCalled = false;
    app.Start([&](bool) { startCalled = true; });

    network::Timer later(&loop, [&]() { app.Shutdown([&]() { loop.Quit(); }); });
    later.Start(0.2);
    network::Timer guard(&loop, [&]() {
        LOG_ERROR << "Shutdown during startup timed out";
        std::abort();
    });
    guard.Start(10.0);
    loop.Loop();

    assert(!startCalled);
    assert(app.phase() == GatewayApp::kStopped);
    assert(!app.worker()->alive());
    LOG_INFO << "Lifecycle shutdown during startup PASS";
}

int main(int argc, char* argv[]) {
    if (argc > 1 && std::strcmp(argv[1], "--worker") == 0) {
        return runWorker();
    }
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);
    testServeAndShutdown(true);
    testServeAndShutdown(false);
    testStartupFailures();
    testWorkerDiesWhileServing();
    testShutdownDuringStartup();
    return 0;
}
