#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Buffer.h"
#include "gateway/network/Callbacks.h"
#include "gateway/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace gateway {
namespace network {

class Channel;
class EventLoop;
class Socket;

// An accepted client connection. Owned by TcpServer through a shared_ptr;
// every method except Send/Shutdown/ForceClose must run on the loop thread.
class TcpConnection : gateway::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }
    bool secure() const { return tlsState_ == 2; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    Buffer* inputBuffer() { return &inputBuffer_; }

    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Half-close once the output buffer drains.
    void Shutdown();
    void ForceClose();

    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when TcpServer accepts a new connection
    void ConnectEstablished();
    // Called when TcpServer has removed me from its map
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void Touch();

    bool tlsEnabled() const { return tlsCtx_ != nullptr; }
    bool tlsTryInitFromPeek();
    bool tlsDoHandshake();
    ssize_t tlsReadOnce(char* buf, size_t cap, int* savedErrno);
    ssize_t tlsWriteOnce(const void* data, size_t len, int* savedErrno);
    ssize_t WriteRaw(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    CloseCallback closeCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> lastActiveNs_;

    // TLS is detected from the first byte of the stream (0x16 = handshake).
    ssl_ctx_st* tlsCtx_{nullptr};
    ssl_st* ssl_{nullptr};
    int tlsState_{0}; // 0 unknown/plain, 1 handshake, 2 established
    bool tlsWantWrite_{false};
};

} // namespace network
} // namespace gateway
