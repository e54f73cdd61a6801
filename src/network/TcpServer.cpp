#include "gateway/network/TcpServer.h"
#include "gateway/network/Acceptor.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Socket.h"
#include "gateway/network/Timer.h"
#include "gateway/common/Logger.h"

#include <cstdio>
#include <functional>
#include <vector>

namespace gateway {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      started_(false),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    cleanupTimer_.reset();
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->SetCloseCallback(CloseCallback());
        conn->ConnectDestroyed();
    }
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    auto ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

void TcpServer::SetIdleTimeout(double idleTimeoutSec) {
    idleTimeoutSec_ = idleTimeoutSec;
}

bool TcpServer::Start() {
    if (started_) return true;
    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer [" << name_ << "] cannot listen on " << hostport_;
        return false;
    }
    started_ = true;

    if (idleTimeoutSec_ > 0.0) {
        const double interval = idleTimeoutSec_ < 1.0 ? idleTimeoutSec_ : 1.0;
        cleanupTimer_.reset(new Timer(loop_, [this]() { CleanupIdleConnections(); }));
        cleanupTimer_->Start(interval, interval);
    }
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << hostport_
             << (tlsCtx_ ? " (TLS enabled)" : "");
    return true;
}

void TcpServer::CleanupIdleConnections() {
    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (auto const& [name, conn] : connections_) {
        if (conn && now - conn->LastActiveTime() > timeout) {
            LOG_DEBUG << "TcpServer [" << name_ << "] closing idle conn " << name
                      << " peer=" << conn->peerAddress().toIpPort();
            toClose.push_back(conn);
        }
    }

    for (auto& conn : toClose) {
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[64];
    std::snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), next_conn_id_);
    ++next_conn_id_;
    std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer [" << name_ << "] new connection [" << connName << "] from " << peerAddr.toIpPort();

    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            Socket::GetLocalAddr(sockfd),
                                            peerAddr,
                                            tlsCtx_ ? tlsCtx_->ctx() : nullptr));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    conn->ConnectEstablished();
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Deferred: we are inside the connection's own event callback.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer [" << name_ << "] remove connection " << conn->name();
    connections_.erase(conn->name());
    conn->ConnectDestroyed();
}

} // namespace network
} // namespace gateway
