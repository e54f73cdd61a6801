#include "gateway/network/TcpConnection.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Socket.h"
#include "gateway/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace gateway {
namespace network {

namespace {

std::int64_t ToSteadyNs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      lastActiveNs_(ToSteadyNs(std::chrono::steady_clock::now())),
      tlsCtx_(tlsCtx) {
    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] fd=" << channel_->fd();
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    Touch();
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::tlsTryInitFromPeek() {
    if (!tlsEnabled() || tlsState_ != 0) return false;

    unsigned char b = 0;
    const ssize_t n = ::recv(channel_->fd(), &b, 1, MSG_PEEK);
    if (n <= 0) return false;

    if (b != 0x16) {
        // Plain HTTP on the TLS-enabled port.
        tlsCtx_ = nullptr;
        return false;
    }

    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        tlsCtx_ = nullptr;
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_accept_state(s);
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = 1;
    tlsWantWrite_ = false;
    return true;
}

bool TcpConnection::tlsDoHandshake() {
    if (!ssl_ || tlsState_ != 1) return false;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_accept(s);
    if (r == 1) {
        tlsState_ = 2;
        tlsWantWrite_ = false;
        LOG_DEBUG << "TLS established [" << name_ << "] " << SSL_get_version(s);
        return true;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        tlsWantWrite_ = false;
        return false;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return false;
    }
    unsigned long le = ERR_get_error();
    if (le != 0) {
        char buf[256];
        ERR_error_string_n(le, buf, sizeof(buf));
        LOG_WARN << "TLS handshake failed [" << name_ << "]: " << buf;
    } else {
        LOG_WARN << "TLS handshake failed [" << name_ << "] error=" << e;
    }
    HandleClose();
    return false;
}

ssize_t TcpConnection::tlsReadOnce(char* buf, size_t cap, int* savedErrno) {
    if (!ssl_ || cap == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_read(s, buf, static_cast<int>(cap));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return -2;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

ssize_t TcpConnection::tlsWriteOnce(const void* data, size_t len, int* savedErrno) {
    if (!ssl_ || len == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return -2;
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

// -2 means "would block" for both transports.
ssize_t TcpConnection::WriteRaw(const void* data, size_t len, int* savedErrno) {
    if (ssl_ && tlsState_ == 2) {
        return tlsWriteOnce(data, len, savedErrno);
    }
    ssize_t n = ::send(channel_->fd(), data, len, MSG_NOSIGNAL);
    if (n < 0) {
        if (errno == EWOULDBLOCK || errno == EAGAIN) return -2;
        *savedErrno = errno;
    }
    return n;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsEnabled() && tlsState_ == 0) {
        (void)tlsTryInitFromPeek();
    }
    if (ssl_ && tlsState_ == 1) {
        (void)tlsDoHandshake();
        if (tlsState_ != 2) return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (ssl_ && tlsState_ == 2) {
        // Records already decrypted inside SSL do not make the fd readable again.
        char tmp[64 * 1024];
        ssize_t total = 0;
        do {
            n = tlsReadOnce(tmp, sizeof(tmp), &savedErrno);
            if (n > 0) {
                inputBuffer_.Append(tmp, static_cast<size_t>(n));
                total += n;
            }
        } while (n > 0 && SSL_pending(reinterpret_cast<SSL*>(ssl_)) > 0);
        if (total > 0) {
            n = total;
        } else if (n == -2) {
            return;
        }
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
        if (n < 0 && (savedErrno == EAGAIN || savedErrno == EINTR)) return;
    }

    if (n > 0) {
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else {
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] errno=" << savedErrno;
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (ssl_ && tlsState_ == 1 && tlsWantWrite_) {
        (void)tlsDoHandshake();
        if (tlsState_ != 2) return;
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            return;
        }
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }

    int savedErrno = 0;
    ssize_t n = WriteRaw(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
    if (n == -2) return;
    if (n > 0) {
        Touch();
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else {
        LOG_DEBUG << "TcpConnection::HandleWrite [" << name_ << "] errno=" << savedErrno;
        HandleClose();
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose [" << name_ << "] fd=" << channel_->fd();
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    const int err = Socket::GetSocketError(channel_->fd());
    if (err != 0) {
        LOG_DEBUG << "TcpConnection::HandleError [" << name_ << "] SO_ERROR=" << err;
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
            ptr->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;

    if (state_ == kDisconnected) {
        LOG_WARN << "TcpConnection [" << name_ << "] disconnected, give up writing";
        return;
    }

    if (ssl_ && tlsState_ == 1) {
        (void)tlsDoHandshake();
    }

    // if nothing in output queue, try write directly
    const bool canWriteNow = !(ssl_ && tlsState_ != 2);
    if (canWriteNow && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        nwrote = WriteRaw(data, len, &savedErrno);
        if (nwrote >= 0) {
            Touch();
            remaining = len - static_cast<size_t>(nwrote);
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else if (nwrote == -2) {
            nwrote = 0;
        } else {
            LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "] errno=" << savedErrno;
            if (savedErrno == EPIPE || savedErrno == ECONNRESET) {
                HandleClose();
                return;
            }
            nwrote = 0;
        }
    }

    if (remaining > 0) {
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([conn = shared_from_this()]() { conn->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        if (ssl_ && tlsState_ == 2) {
            SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
        }
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        loop_->RunInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::Touch() {
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::nanoseconds(lastActiveNs_.load(std::memory_order_relaxed)));
}

} // namespace network
} // namespace gateway
