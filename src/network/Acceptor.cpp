#include "gateway/network/Acceptor.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/common/Logger.h"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace gateway {
namespace network {

namespace {

int CreateNonblockingOrDie() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor socket() failed errno=" << errno;
    }
    return sockfd;
}

} // namespace

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(CreateNonblockingOrDie()),
      accept_channel_(loop, accept_socket_.fd()),
      bound_(false),
      listening_(false) {
    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);
    bound_ = accept_socket_.BindAddress(listenAddr);

    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
}

bool Acceptor::Listen() {
    if (!bound_ || !accept_socket_.Listen()) return false;
    listening_ = true;
    accept_channel_.EnableReading();
    return true;
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else if (errno != EAGAIN && errno != EINTR) {
        LOG_ERROR << "Acceptor::HandleRead accept errno=" << errno;
        if (errno == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace gateway
