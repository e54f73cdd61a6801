#pragma once

#include "gateway/common/noncopyable.h"

namespace gateway {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : gateway::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    // Pending SO_ERROR of a non-blocking connect (0 when connected).
    static int GetSocketError(int sockfd);
    static InetAddress GetLocalAddr(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace gateway
