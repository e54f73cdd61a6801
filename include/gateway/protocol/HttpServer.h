#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/TcpServer.h"
#include "gateway/protocol/HttpResponse.h"

#include <functional>
#include <memory>

namespace gateway {
namespace protocol {

class HttpRequest;

// HTTP/1.1 front end with asynchronous handlers. A connection carries one
// request at a time; pipelined requests wait in the input buffer until the
// handler has answered the previous one.
class HttpServer : gateway::common::noncopyable {
public:
    // Must be called exactly once per request, on the loop thread, either
    // from inside the handler or later.
    using ResponseCallback = std::function<void(HttpResponse&&)>;
    using HttpCallback = std::function<void(const HttpRequest&, ResponseCallback)>;

    HttpServer(gateway::network::EventLoop* loop,
               const gateway::network::InetAddress& listenAddr,
               const std::string& name,
               gateway::network::TcpServer::Option option = gateway::network::TcpServer::kNoReusePort);
    ~HttpServer();

    gateway::network::EventLoop* getLoop() const { return server_.getLoop(); }
    gateway::network::TcpServer& tcpServer() { return server_; }
    size_t connectionCount() const { return server_.connectionCount(); }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }
    // 0 = unlimited
    void setMaxBodyBytes(size_t n) { maxBodyBytes_ = n; }

    bool start();

private:
    struct ConnectionState;

    void onConnection(const gateway::network::TcpConnectionPtr& conn);
    void onMessage(const gateway::network::TcpConnectionPtr& conn,
                   gateway::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void onRequest(const gateway::network::TcpConnectionPtr& conn, ConnectionState* state);
    void onResponse(const std::weak_ptr<gateway::network::TcpConnection>& weakConn,
                    HttpResponse&& response, bool close, bool head);
    void sendError(const gateway::network::TcpConnectionPtr& conn, int status);

    gateway::network::TcpServer server_;
    HttpCallback httpCallback_;
    size_t maxBodyBytes_{0};
    // Expires with the server; pending responders check it.
    std::shared_ptr<int> lifeToken_;
};

} // namespace protocol
} // namespace gateway
