#include "gateway/protocol/HttpServer.h"
#include "gateway/protocol/HttpContext.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/network/EventLoop.h"
#include "gateway/common/Logger.h"

namespace gateway {
namespace protocol {

using gateway::network::Buffer;
using gateway::network::TcpConnection;
using gateway::network::TcpConnectionPtr;

struct HttpServer::ConnectionState {
    explicit ConnectionState(size_t maxBodyBytes) : parser(maxBodyBytes) {}

    HttpContext parser;
    bool busy{false};        // a request is with the handler
    bool dispatching{false}; // inside httpCallback_
};

HttpServer::HttpServer(gateway::network::EventLoop* loop,
                       const gateway::network::InetAddress& listenAddr,
                       const std::string& name,
                       gateway::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option),
      lifeToken_(std::make_shared<int>(0)) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

HttpServer::~HttpServer() {
    lifeToken_.reset();
}

bool HttpServer::start() {
    return server_.Start();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<ConnectionState>(maxBodyBytes_));
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    auto* holder = std::any_cast<std::shared_ptr<ConnectionState>>(conn->GetMutableContext());
    if (!holder || !*holder) return;
    ConnectionState* state = holder->get();

    while (!state->busy && conn->connected()) {
        if (!state->parser.parseRequest(buf, receiveTime)) {
            const int status = state->parser.errorStatus() ? state->parser.errorStatus() : 400;
            LOG_DEBUG << "HttpServer: rejecting request from " << conn->peerAddress().toIpPort()
                      << " status=" << status;
            buf->RetrieveAll();
            sendError(conn, status);
            return;
        }
        if (state->parser.headersDone() && state->parser.takeExpectContinue()) {
            conn->Send("HTTP/1.1 100 Continue\r\n\r\n");
        }
        if (!state->parser.gotAll()) {
            return;
        }
        onRequest(conn, state);
        if (buf->ReadableBytes() == 0) {
            return;
        }
    }
}

void HttpServer::onRequest(const TcpConnectionPtr& conn, ConnectionState* state) {
    state->busy = true;
    HttpRequest req;
    req.swap(state->parser.request());
    state->parser.reset();

    const std::string connection = req.getHeader("Connection");
    const bool close = HeaderHasToken(connection, "close") ||
                       (req.getVersion() == HttpRequest::kHttp10 && !HeaderHasToken(connection, "keep-alive"));
    const bool head = req.getMethod() == HttpRequest::kHead;

    std::weak_ptr<TcpConnection> weakConn(conn);
    std::weak_ptr<int> life(lifeToken_);
    auto answered = std::make_shared<bool>(false);
    ResponseCallback done = [this, weakConn, life, close, head, answered](HttpResponse&& response) {
        if (*answered) {
            LOG_WARN << "HttpServer: response callback invoked twice; ignored";
            return;
        }
        *answered = true;
        if (life.expired()) return;
        onResponse(weakConn, std::move(response), close, head);
    };

    state->dispatching = true;
    if (httpCallback_) {
        httpCallback_(req, done);
    } else {
        HttpResponse response;
        response.setJsonBody(HttpResponse::k404NotFound, "{\"detail\":\"Not Found\"}");
        done(std::move(response));
    }
    state->dispatching = false;
}

void HttpServer::onResponse(const std::weak_ptr<TcpConnection>& weakConn,
                            HttpResponse&& response, bool close, bool head) {
    TcpConnectionPtr conn = weakConn.lock();
    if (!conn || !conn->connected()) return;
    auto* holder = std::any_cast<std::shared_ptr<ConnectionState>>(conn->GetMutableContext());
    if (!holder || !*holder) return;
    ConnectionState* state = holder->get();

    close = close || response.closeConnection();
    response.setCloseConnection(close);
    response.setSuppressBody(head);

    Buffer out;
    response.appendToBuffer(&out);
    conn->Send(out.Peek(), out.ReadableBytes());

    if (close) {
        conn->Shutdown();
        return;
    }

    state->busy = false;
    // An asynchronous answer resumes pipelined input that arrived meanwhile.
    if (!state->dispatching && conn->inputBuffer()->ReadableBytes() > 0) {
        std::weak_ptr<int> life(lifeToken_);
        conn->getLoop()->QueueInLoop([this, weakConn, life]() {
            if (life.expired()) return;
            TcpConnectionPtr c = weakConn.lock();
            if (c && c->connected()) {
                onMessage(c, c->inputBuffer(), std::chrono::system_clock::now());
            }
        });
    }
}

void HttpServer::sendError(const TcpConnectionPtr& conn, int status) {
    HttpResponse response(true);
    response.setJsonBody(status, std::string("{\"detail\":\"") + ReasonPhrase(status) + "\"}");
    Buffer out;
    response.appendToBuffer(&out);
    conn->Send(out.Peek(), out.ReadableBytes());
    conn->Shutdown();
}

} // namespace protocol
} // namespace gateway
