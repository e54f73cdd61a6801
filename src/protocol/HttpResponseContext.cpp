#include "gateway/protocol/HttpResponseContext.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace gateway {
namespace protocol {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    pending_.clear();
    error_.clear();
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    body_.clear();
    chunked_ = false;
    bodyRemaining_ = 0;
    keepAlive_ = false;
    needsCloseToFinish_ = false;
    chunkState_ = kChunkSize;
    chunkRemaining_ = 0;
}

bool HttpResponseContext::fail(const std::string& why) {
    state_ = kError;
    error_ = why;
    return false;
}

bool HttpResponseContext::parseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();

    size_t lineEnd = headerBlock.find("\r\n");
    if (lineEnd == std::string::npos) return fail("malformed status line");
    const std::string statusLine = headerBlock.substr(0, lineEnd);
    size_t pos = lineEnd + 2;

    // HTTP/1.1 200 OK
    if (statusLine.size() < 12 || statusLine.compare(0, 7, "HTTP/1.") != 0 || statusLine[8] != ' ') {
        return fail("malformed status line");
    }
    if (statusLine[7] != '0' && statusLine[7] != '1') return fail("unsupported HTTP version");
    httpMinor_ = statusLine[7] - '0';
    for (size_t i = 9; i < 12; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(statusLine[i]))) return fail("malformed status code");
    }
    statusCode_ = std::atoi(statusLine.substr(9, 3).c_str());
    if (statusCode_ < 100) return fail("malformed status code");
    reason_ = statusLine.size() > 13 ? statusLine.substr(13) : std::string();

    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return fail("malformed header line");
        headers_.emplace_back(line.substr(0, colon), Trim(line.substr(colon + 1)));
    }

    const std::string te = getHeader("Transfer-Encoding");
    const std::string cl = getHeader("Content-Length");
    const std::string conn = getHeader("Connection");

    keepAlive_ = (httpMinor_ == 0) ? HeaderHasToken(conn, "keep-alive") : !HeaderHasToken(conn, "close");

    chunked_ = false;
    needsCloseToFinish_ = false;
    bodyRemaining_ = 0;
    const bool bodyless = noBodyExpected_ || statusCode_ == 204 || statusCode_ == 304 || statusCode_ < 200;
    if (bodyless) {
        state_ = kGotAll;
        return true;
    }
    if (!te.empty() && HeaderHasToken(te, "chunked")) {
        chunked_ = true;
        chunkState_ = kChunkSize;
    } else if (!cl.empty()) {
        char* endp = nullptr;
        const long long n = std::strtoll(cl.c_str(), &endp, 10);
        if (endp == cl.c_str() || n < 0) return fail("invalid Content-Length");
        bodyRemaining_ = static_cast<size_t>(n);
    } else {
        needsCloseToFinish_ = true;
        keepAlive_ = false;
    }

    state_ = kExpectBody;
    return true;
}

bool HttpResponseContext::consumeChunked() {
    while (true) {
        if (chunkState_ == kChunkSize) {
            const size_t crlf = pending_.find("\r\n");
            if (crlf == std::string::npos) {
                if (pending_.size() > 1024) return fail("chunk size line too long");
                return true;
            }
            std::string line = pending_.substr(0, crlf);
            pending_.erase(0, crlf + 2);
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = Trim(line);
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (line.empty() || endp == line.c_str() || *endp != '\0') return fail("malformed chunk size");
            chunkRemaining_ = static_cast<size_t>(n);
            chunkState_ = (chunkRemaining_ == 0) ? kChunkTrailer : kChunkData;
        } else if (chunkState_ == kChunkData) {
            if (pending_.size() < chunkRemaining_ + 2) return true;
            if (pending_.compare(chunkRemaining_, 2, "\r\n") != 0) return fail("missing CRLF after chunk");
            body_.append(pending_, 0, chunkRemaining_);
            pending_.erase(0, chunkRemaining_ + 2);
            chunkRemaining_ = 0;
            chunkState_ = kChunkSize;
        } else {
            const size_t crlf = pending_.find("\r\n");
            if (crlf == std::string::npos) {
                if (pending_.size() > kMaxHeaderBytes) return fail("trailer section too large");
                return true;
            }
            pending_.erase(0, crlf + 2);
            if (crlf == 0) {
                state_ = kGotAll;
                return true;
            }
        }
    }
}

bool HttpResponseContext::consumeBody() {
    if (chunked_) return consumeChunked();
    if (needsCloseToFinish_) {
        body_.append(pending_);
        pending_.clear();
        return true;
    }
    const size_t take = std::min(bodyRemaining_, pending_.size());
    body_.append(pending_, 0, take);
    pending_.erase(0, take);
    bodyRemaining_ -= take;
    if (bodyRemaining_ == 0) state_ = kGotAll;
    return true;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError || state_ == kGotAll) return state_ == kGotAll;
    if (data && len > 0) pending_.append(data, len);

    while (state_ == kExpectStatusLine) {
        const size_t hdrPos = pending_.find("\r\n\r\n");
        if (hdrPos == std::string::npos) {
            if (pending_.size() > kMaxHeaderBytes) return fail("response header too large");
            return false;
        }
        const std::string headerBlock = pending_.substr(0, hdrPos + 4);
        pending_.erase(0, hdrPos + 4);
        if (!parseHeaderBlock(headerBlock)) return false;

        // 100 Continue and friends: the real response follows.
        if (statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101) {
            state_ = kExpectStatusLine;
            headers_.clear();
            statusCode_ = 0;
            reason_.clear();
        }
    }

    if (state_ == kExpectBody) {
        if (!consumeBody()) return false;
    }
    return state_ == kGotAll;
}

bool HttpResponseContext::finishOnClose() {
    if (state_ == kGotAll) return true;
    if (state_ == kExpectBody && needsCloseToFinish_) {
        body_.append(pending_);
        pending_.clear();
        state_ = kGotAll;
        return true;
    }
    if (state_ != kError) {
        fail(state_ == kExpectStatusLine ? "connection closed before response headers"
                                         : "connection closed mid-body");
    }
    return false;
}

} // namespace protocol
} // namespace gateway
