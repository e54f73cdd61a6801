#include "gateway/upstream/UpstreamClient.h"
#include "gateway/common/Logger.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Socket.h"
#include "gateway/network/Timer.h"
#include "gateway/protocol/HttpResponseContext.h"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace gateway {
namespace upstream {

using gateway::network::Channel;
using gateway::network::EventLoop;
using gateway::network::InetAddress;
using gateway::network::Timer;

namespace {

std::string ConnectErrorText(int err) {
    if (err == ECONNREFUSED) return "connection refused";
    if (err == ETIMEDOUT) return "connect timed out";
    return std::strerror(err);
}

std::string SecondsText(double sec) {
    std::string s = std::to_string(sec);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s + "s";
}

} // namespace

const char* UpstreamResult::OutcomeName(Outcome o) {
    switch (o) {
        case kOk: return "ok";
        case kUnreachable: return "unreachable";
        case kFault: return "fault";
    }
    return "unknown";
}

// State of one request on its own connection. Callbacks registered on the loop
// hold only weak references; the client's map keeps the call alive.
class UpstreamCall : gateway::common::noncopyable,
                     public std::enable_shared_from_this<UpstreamCall> {
public:
    UpstreamCall(UpstreamClient* client, uint64_t id, const InetAddress& addr,
                 std::string out, bool headRequest, UpstreamClient::Callback cb)
        : client_(client),
          loop_(client->getLoop()),
          id_(id),
          addr_(addr),
          out_(std::move(out)),
          cb_(std::move(cb)) {
        parser_.setNoBodyExpected(headRequest);
    }

    ~UpstreamCall() { Cleanup(); }

    void Begin(double connectTimeoutSec, double requestTimeoutSec);
    void Abort() {
        state_ = kDone;
        cb_ = nullptr;
        Cleanup();
    }

private:
    enum State { kIdle, kConnecting, kSending, kReading, kDone };

    void OnWritable();
    void OnReadable();
    void OnError();
    void OnHangup();
    void OnConnectTimeout();
    void OnRequestTimeout();

    void Fail(UpstreamResult::Outcome outcome, const std::string& description);
    void Succeed();
    void Finish(UpstreamResult&& result);
    void Cleanup();

    UpstreamClient* client_;
    EventLoop* loop_;
    const uint64_t id_;
    const InetAddress addr_;
    std::string out_;
    size_t outOffset_{0};
    UpstreamClient::Callback cb_;

    State state_{kIdle};
    int fd_{-1};
    std::unique_ptr<Channel> channel_;
    std::unique_ptr<Timer> connectTimer_;
    std::unique_ptr<Timer> requestTimer_;
    double connectTimeoutSec_{0.0};
    double requestTimeoutSec_{0.0};
    gateway::protocol::HttpResponseContext parser_;
};

void UpstreamCall::Begin(double connectTimeoutSec, double requestTimeoutSec) {
    if (state_ != kIdle) return;
    connectTimeoutSec_ = connectTimeoutSec;
    requestTimeoutSec_ = requestTimeoutSec;

    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd_ < 0) {
        Fail(UpstreamResult::kFault, std::string("socket: ") + std::strerror(errno));
        return;
    }
    int one = 1;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof one);

    std::weak_ptr<UpstreamCall> weak(shared_from_this());
    channel_.reset(new Channel(loop_, fd_));
    channel_->SetWriteCallback([weak]() {
        if (auto self = weak.lock()) self->OnWritable();
    });
    channel_->SetReadCallback([weak](std::chrono::system_clock::time_point) {
        if (auto self = weak.lock()) self->OnReadable();
    });
    channel_->SetErrorCallback([weak]() {
        if (auto self = weak.lock()) self->OnError();
    });
    channel_->SetCloseCallback([weak]() {
        if (auto self = weak.lock()) self->OnHangup();
    });

    connectTimer_.reset(new Timer(loop_, [weak]() {
        if (auto self = weak.lock()) self->OnConnectTimeout();
    }));
    requestTimer_.reset(new Timer(loop_, [weak]() {
        if (auto self = weak.lock()) self->OnRequestTimeout();
    }));
    connectTimer_->Start(connectTimeoutSec_);
    requestTimer_->Start(requestTimeoutSec_);

    state_ = kConnecting;
    const int ret = ::connect(fd_, addr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int savedErrno = (ret == 0) ? 0 : errno;
    if (ret == 0 || savedErrno == EISCONN) {
        OnWritable();
    } else if (savedErrno == EINPROGRESS || savedErrno == EINTR) {
        channel_->EnableWriting();
    } else {
        Fail(UpstreamResult::kUnreachable, ConnectErrorText(savedErrno));
    }
}

void UpstreamCall::OnWritable() {
    if (state_ == kConnecting) {
        const int err = gateway::network::Socket::GetSocketError(fd_);
        if (err != 0) {
            Fail(UpstreamResult::kUnreachable, ConnectErrorText(err));
            return;
        }
        state_ = kSending;
        connectTimer_->Cancel();
        channel_->EnableReading();
    }
    if (state_ != kSending) return;

    while (outOffset_ < out_.size()) {
        const ssize_t n = ::send(fd_, out_.data() + outOffset_, out_.size() - outOffset_, MSG_NOSIGNAL);
        if (n > 0) {
            outOffset_ += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!channel_->IsWriting()) channel_->EnableWriting();
            return;
        }
        Fail(UpstreamResult::kFault, std::string("sending request failed: ") + std::strerror(errno));
        return;
    }

    state_ = kReading;
    if (channel_->IsWriting()) channel_->DisableWriting();
}

void UpstreamCall::OnReadable() {
    if (state_ != kSending && state_ != kReading) return;

    char buf[65536];
    while (state_ != kDone) {
        const ssize_t n = ::recv(fd_, buf, sizeof buf, 0);
        if (n > 0) {
            parser_.feed(buf, static_cast<size_t>(n));
            if (parser_.hasError()) {
                Fail(UpstreamResult::kFault, "malformed response from worker: " + parser_.errorMessage());
            } else if (parser_.gotAll()) {
                Succeed();
            }
            continue;
        }
        if (n == 0) {
            if (parser_.finishOnClose()) {
                Succeed();
            } else {
                Fail(UpstreamResult::kFault, parser_.errorMessage());
            }
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        const int err = errno;
        Fail(UpstreamResult::kFault,
             err == ECONNRESET ? std::string("connection reset by worker") : std::string("recv: ") + std::strerror(err));
        return;
    }
}

void UpstreamCall::OnError() {
    if (state_ == kDone) return;
    const int err = gateway::network::Socket::GetSocketError(fd_);
    if (state_ == kConnecting) {
        Fail(UpstreamResult::kUnreachable, ConnectErrorText(err ? err : ECONNREFUSED));
        return;
    }
    // A complete response may be queued ahead of the reset.
    OnReadable();
    if (state_ == kDone) return;
    Fail(UpstreamResult::kFault,
         err == ECONNRESET || err == 0 ? std::string("connection reset by worker") : std::string(std::strerror(err)));
}

void UpstreamCall::OnHangup() {
    if (state_ == kConnecting) {
        OnError();
    } else {
        OnReadable();
    }
}

void UpstreamCall::OnConnectTimeout() {
    if (state_ != kConnecting) return;
    Fail(UpstreamResult::kUnreachable, "connect timed out after " + SecondsText(connectTimeoutSec_));
}

void UpstreamCall::OnRequestTimeout() {
    if (state_ == kDone) return;
    if (state_ == kConnecting) {
        Fail(UpstreamResult::kUnreachable, "connect timed out after " + SecondsText(requestTimeoutSec_));
        return;
    }
    Fail(UpstreamResult::kFault, "worker did not answer within " + SecondsText(requestTimeoutSec_));
}

void UpstreamCall::Fail(UpstreamResult::Outcome outcome, const std::string& description) {
    UpstreamResult result;
    result.outcome = outcome;
    result.description = description;
    Finish(std::move(result));
}

void UpstreamCall::Succeed() {
    UpstreamResult result;
    result.outcome = UpstreamResult::kOk;
    result.statusCode = parser_.statusCode();
    result.reason = parser_.reason();
    result.headers = parser_.headers();
    result.body = parser_.body();
    Finish(std::move(result));
}

void UpstreamCall::Finish(UpstreamResult&& result) {
    if (state_ == kDone) return;
    state_ = kDone;
    std::shared_ptr<UpstreamCall> self(shared_from_this());
    Cleanup();
    client_->Forget(id_);

    LOG_DEBUG << "Upstream " << addr_.toIpPort() << " call#" << id_ << " "
              << UpstreamResult::OutcomeName(result.outcome)
              << (result.ok() ? " status=" + std::to_string(result.statusCode) : " (" + result.description + ")");

    UpstreamClient::Callback cb = std::move(cb_);
    cb_ = nullptr;
    if (cb) cb(std::move(result));
}

void UpstreamCall::Cleanup() {
    if (channel_) loop_->ReleaseChannel(std::move(channel_));
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    connectTimer_.reset();
    requestTimer_.reset();
}

UpstreamClient::UpstreamClient(EventLoop* loop, double connectTimeoutSec, double requestTimeoutSec)
    : loop_(loop),
      connectTimeoutSec_(connectTimeoutSec),
      requestTimeoutSec_(requestTimeoutSec) {
}

UpstreamClient::~UpstreamClient() {
    std::map<uint64_t, std::shared_ptr<UpstreamCall>> calls;
    calls.swap(calls_);
    for (auto& kv : calls) {
        kv.second->Abort();
    }
}

void UpstreamClient::Send(const InetAddress& addr, UpstreamRequest request, Callback cb) {
    const uint64_t id = nextId_++;
    const bool head = request.method == "HEAD";
    auto call = std::make_shared<UpstreamCall>(this, id, addr, SerializeRequest(request, addr.toIpPort()), head,
                                               std::move(cb));
    calls_[id] = call;

    // Started from the pending queue so the callback never runs inside Send.
    const double connectTimeout = connectTimeoutSec_;
    const double requestTimeout = requestTimeoutSec_;
    std::weak_ptr<UpstreamCall> weak(call);
    loop_->QueueInLoop([weak, connectTimeout, requestTimeout]() {
        if (auto c = weak.lock()) c->Begin(connectTimeout, requestTimeout);
    });
}

void UpstreamClient::Forget(uint64_t id) {
    calls_.erase(id);
}

std::string UpstreamClient::SerializeRequest(const UpstreamRequest& request, const std::string& hostHeader) {
    std::string out;
    out.reserve(256 + request.body.size());
    out += request.method;
    out += ' ';
    out += request.target.empty() ? std::string("/") : request.target;
    out += " HTTP/1.1\r\nHost: ";
    out += hostHeader;
    out += "\r\n";
    for (const auto& h : request.headers) {
        if (gateway::protocol::IEquals(h.first, "Host") ||
            gateway::protocol::IEquals(h.first, "Content-Length") ||
            gateway::protocol::IEquals(h.first, "Connection")) {
            continue;
        }
        out += h.first;
        out += ": ";
        out += h.second;
        out += "\r\n";
    }
    const bool bodyMethod = request.method == "POST" || request.method == "PUT" || request.method == "PATCH";
    if (bodyMethod || !request.body.empty()) {
        out += "Content-Length: ";
        out += std::to_string(request.body.size());
        out += "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += request.body;
    return out;
}

} // namespace upstream
} // namespace gateway
