#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Channel.h"
#include "gateway/network/Socket.h"

#include <functional>

namespace gateway {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : gateway::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listening() const { return listening_; }
    // False when the address could not be bound or listened on.
    bool Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool bound_;
    bool listening_;
};

} // namespace network
} // namespace gateway
