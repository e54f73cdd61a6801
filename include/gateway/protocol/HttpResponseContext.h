#pragma once

#include "gateway/protocol/HttpHeaders.h"

#include <cstddef>
#include <string>

namespace gateway {
namespace protocol {

// Incremental HTTP/1.x response parser for the worker link.
// - Content-Length, chunked (decoded into body()) and read-until-close bodies.
// - Interim 1xx responses are skipped.
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectBody, kGotAll, kError };

    static const size_t kMaxHeaderBytes = 64 * 1024;

    // Returns true once the response is complete.
    bool feed(const char* data, size_t len);
    // Peer closed the stream. Completes a read-until-close body; any other
    // unfinished response becomes an error.
    bool finishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    bool headersDone() const { return state_ == kExpectBody || state_ == kGotAll; }
    const std::string& errorMessage() const { return error_; }

    void reset();

    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }
    const HeaderList& headers() const { return headers_; }
    std::string getHeader(const std::string& field) const {
        const std::string* v = FindHeader(headers_, field);
        return v ? *v : std::string();
    }
    const std::string& body() const { return body_; }
    bool keepAlive() const { return keepAlive_; }
    bool needsCloseToFinish() const { return needsCloseToFinish_; }

    // Set before feeding when the request was HEAD (no body follows).
    void setNoBodyExpected(bool on) { noBodyExpected_ = on; }

private:
    bool fail(const std::string& why);
    bool parseHeaderBlock(const std::string& headerBlock);
    bool consumeBody();
    bool consumeChunked();

    ParseState state_{kExpectStatusLine};
    std::string pending_;
    std::string error_;

    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;
    HeaderList headers_;
    std::string body_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    bool keepAlive_{false};
    bool needsCloseToFinish_{false};
    bool noBodyExpected_{false};

    enum ChunkState { kChunkSize, kChunkData, kChunkTrailer };
    ChunkState chunkState_{kChunkSize};
    size_t chunkRemaining_{0};
};

} // namespace protocol
} // namespace gateway
