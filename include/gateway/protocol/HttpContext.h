#pragma once

#include "gateway/network/Buffer.h"
#include "gateway/protocol/HttpRequest.h"

#include <chrono>

namespace gateway {
namespace protocol {

// Incremental HTTP/1.x request parser; the body is complete (Content-Length
// or de-chunked) once gotAll() is true.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static const size_t kDefaultMaxHeaderBytes = 64 * 1024;

    explicit HttpContext(size_t maxBodyBytes = 0, size_t maxHeaderBytes = kDefaultMaxHeaderBytes)
        : state_(kExpectRequestLine),
          maxBodyBytes_(maxBodyBytes),
          maxHeaderBytes_(maxHeaderBytes) {}

    // return false if some error; errorStatus() tells which response to send
    bool parseRequest(gateway::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    bool headersDone() const { return state_ == kExpectBody || state_ == kGotAll; }
    int errorStatus() const { return errorStatus_; }

    // True once per request, when the client sent "Expect: 100-continue"
    // and is waiting for the go-ahead before sending the body.
    bool takeExpectContinue() {
        bool v = expectContinue_;
        expectContinue_ = false;
        return v;
    }

    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        chunked_ = false;
        bodyRemaining_ = 0;
        chunkSize_ = 0;
        chunkState_ = kChunkSize;
        headerBytes_ = 0;
        errorStatus_ = 0;
        expectContinue_ = false;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processHeadersEnd();
    bool processChunkedBody(gateway::network::Buffer* buf, bool* hasMore);
    bool fail(int status) {
        errorStatus_ = status;
        return false;
    }

    HttpRequestParseState state_;
    HttpRequest request_;

    size_t maxBodyBytes_; // 0 = unlimited
    size_t maxHeaderBytes_;
    size_t headerBytes_{0};
    int errorStatus_{0};
    bool expectContinue_{false};

    // Body parsing state
    enum ChunkState { kChunkSize, kChunkData, kChunkTrailer };
    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    ChunkState chunkState_{kChunkSize};
};

} // namespace protocol
} // namespace gateway
