#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Callbacks.h"
#include "gateway/network/InetAddress.h"
#include "gateway/network/TcpConnection.h"
#include "gateway/network/TlsContext.h"

#include <map>
#include <memory>
#include <string>

namespace gateway {
namespace network {

class Acceptor;
class EventLoop;
class Timer;

// Single-loop acceptor plus the map of live connections.
class TcpServer : gateway::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    size_t connectionCount() const { return connections_.size(); }

    // The listener accepts both HTTPS and plain HTTP by sniffing the first byte.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Close connections idle for longer than idleTimeoutSec (0 disables).
    void SetIdleTimeout(double idleTimeoutSec);

    // False when the listen address is unusable (e.g. port already bound).
    bool Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void CleanupIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::shared_ptr<TlsContext> tlsCtx_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    bool started_;
    int next_conn_id_;
    ConnectionMap connections_;

    double idleTimeoutSec_{0.0};
    std::unique_ptr<Timer> cleanupTimer_;
};

} // namespace network
} // namespace gateway
