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
#include <sys/time.h>
#include <unistd.h>

#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cassert>
#include <csignal>
#include <cstdio>
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

namespace {

std::string tmpFilePath(const std::string& name) {
    return "/tmp/gateway_tls_" + name + "_" + std::to_string(::getpid()) + ".pem";
}

// Writes a fresh self-signed P-256 certificate for localhost and its key.
void writeSelfSignedCert(const std::string& certPath, const std::string& keyPath) {
    EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    assert(kctx);
    assert(EVP_PKEY_keygen_init(kctx) == 1);
    assert(EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx, NID_X9_62_prime256v1) == 1);
    EVP_PKEY* pkey = nullptr;
    assert(EVP_PKEY_keygen(kctx, &pkey) == 1);
    EVP_PKEY_CTX_free(kctx);

    X509* x = X509_new();
    assert(x);
    X509_set_version(x, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x), 1);
    X509_gmtime_adj(X509_getm_notBefore(x), -60);
    X509_gmtime_adj(X509_getm_notAfter(x), 3600);
    assert(X509_set_pubkey(x, pkey) == 1);
    X509_NAME* name = X509_get_subject_name(x);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    assert(X509_set_issuer_name(x, name) == 1);
    assert(X509_sign(x, pkey, EVP_sha256()) > 0);

    FILE* f = std::fopen(certPath.c_str(), "w");
    assert(f);
    assert(PEM_write_X509(f, x) == 1);
    std::fclose(f);
    f = std::fopen(keyPath.c_str(), "w");
    assert(f);
    assert(PEM_write_PrivateKey(f, pkey, nullptr, nullptr, 0, nullptr, nullptr) == 1);
    std::fclose(f);

    X509_free(x);
    EVP_PKEY_free(pkey);
}

int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);
    assert(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    timeval tv;
    tv.tv_sec = 3;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    ::close(fd);
    return ntohs(addr.sin_port);
}

std::string plainExchange(uint16_t port, const std::string& request) {
    int fd = connectTo(port);
    assert(::send(fd, request.data(), request.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(request.size()));
    std::string out;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, buf + n);
    }
    ::close(fd);
    return out;
}

// Handshake, one request, read until the server closes.
std::string tlsExchange(uint16_t port, const std::string& request, std::string* version) {
    int fd = connectTo(port);
    SSL_CTX* cctx = SSL_CTX_new(TLS_client_method());
    assert(cctx);
    SSL_CTX_set_verify(cctx, SSL_VERIFY_NONE, nullptr);
    SSL* ssl = SSL_new(cctx);
    assert(ssl);
    SSL_set_fd(ssl, fd);
    assert(SSL_connect(ssl) == 1);
    if (version) *version = SSL_get_version(ssl);

    assert(SSL_write(ssl, request.data(), static_cast<int>(request.size())) == static_cast<int>(request.size()));
    std::string out;
    char buf[4096];
    int n;
    while ((n = SSL_read(ssl, buf, sizeof(buf))) > 0) {
        out.append(buf, buf + n);
    }

    SSL_shutdown(ssl);
    SSL_free(ssl);
    SSL_CTX_free(cctx);
    ::close(fd);
    return out;
}

int statusOf(const std::string& resp) {
    assert(resp.compare(0, 9, "HTTP/1.1 ") == 0);
    return std::atoi(resp.c_str() + 9);
}

std::string bodyOf(const std::string& resp) {
    const size_t pos = resp.find("\r\n\r\n");
    assert(pos != std::string::npos);
    return resp.substr(pos + 4);
}

} // namespace

void testBadCertificate() {
    network::EventLoop loop;
    GatewayConfig config;
    config.listenHost = "127.0.0.1";
    config.listenPort = pickFreePort();
    config.tlsEnabled = true;
    config.tlsCertPath = "/nonexistent/cert.pem";
    config.tlsKeyPath = "/nonexistent/key.pem";
    ProxyGateway gateway(&loop, config);
    assert(!gateway.Start());
    LOG_INFO << "TLS missing certificate refused PASS";
}

void testTlsAndPlainOnOnePort() {
    const std::string certPath = tmpFilePath("cert");
    const std::string keyPath = tmpFilePath("key");
    writeSelfSignedCert(certPath, keyPath);

    GatewayConfig config;
    config.listenHost = "127.0.0.1";
    config.listenPort = pickFreePort();
    config.workerPort = pickFreePort();
    config.requestTimeoutSec = 3.0;
    config.tlsEnabled = true;
    config.tlsCertPath = certPath;
    config.tlsKeyPath = keyPath;

    network::EventLoop loop;
    std::vector<std::string> seen;
    protocol::HttpServer worker(&loop, network::InetAddress(config.workerPort, true), "FakeWorker");
    worker.setHttpCallback([&](const HttpRequest& req, protocol::HttpServer::ResponseCallback done) {
        seen.push_back(std::string(req.methodString()) + " " + req.path() + " " + req.body());
        HttpResponse resp;
        resp.setStatusCode(HttpResponse::k200Ok);
        resp.setContentType("text/plain");
        resp.setBody("worker saw " + req.path());
        done(std::move(resp));
    });
    assert(worker.start());

    ProxyGateway gateway(&loop, config);
    assert(gateway.Start());

    const uint16_t port = config.listenPort;
    std::thread client([&]() {
        // Plain HTTP on the TLS-enabled port.
        std::string r = plainExchange(port, "GET /health HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 200);
        assert(bodyOf(r).find("\"proxy\":true") != std::string::npos);

        r = plainExchange(port, "GET /api/plain HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(statusOf(r) == 200);
        assert(bodyOf(r) == "worker saw /api/plain");

        // HTTPS is terminated and forwarded over plain loopback.
        std::string version;
        r = tlsExchange(port,
                        "POST /api/secure HTTP/1.1\r\n"
                        "Host: localhost\r\n"
                        "Content-Length: 5\r\n"
                        "Connection: close\r\n"
                        "\r\n"
                        "hello",
                        &version);
        assert(version == "TLSv1.2" || version == "TLSv1.3");
        assert(statusOf(r) == 200);
        assert(bodyOf(r) == "worker saw /api/secure");

        r = tlsExchange(port, "GET /health HTTP/1.1\r\nConnection: close\r\n\r\n", nullptr);
        assert(statusOf(r) == 200);

        r = tlsExchange(port, "GET /elsewhere HTTP/1.1\r\nConnection: close\r\n\r\n", nullptr);
        assert(statusOf(r) == 404);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    network::Timer guard(&loop, [&]() {
        LOG_ERROR << "Gateway TLS test timed out";
        std::abort();
    });
    guard.Start(20.0);
    loop.Loop();
    client.join();

    assert(seen.size() == 2);
    assert(seen[0] == "GET /api/plain ");
    assert(seen[1] == "POST /api/secure hello");

    ::unlink(certPath.c_str());
    ::unlink(keyPath.c_str());
    LOG_INFO << "TLS and plain HTTP on one port PASS";
}

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);
    testBadCertificate();
    testTlsAndPlainOnOnePort();
    return 0;
}
