#include "gateway/protocol/HttpContext.h"
#include "gateway/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace gateway {
namespace protocol {

namespace {

std::string TrimCopy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Strict decimal parse; rejects signs, blanks and overflow.
bool ParseLength(const std::string& text, size_t* out) {
    const std::string v = TrimCopy(text);
    if (v.empty() || v.size() > 18) return false;
    size_t n = 0;
    for (unsigned char c : v) {
        if (!std::isdigit(c)) return false;
        n = n * 10 + static_cast<size_t>(c - '0');
    }
    *out = n;
    return true;
}

} // namespace

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space == end || !request_.setMethod(start, space)) return false;

    start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end || space == start) return false;

    // Absolute-form targets are reduced to their path.
    static const std::string kHttp = "http://";
    static const std::string kHttps = "https://";
    std::string target(start, space);
    size_t schemeLen = 0;
    if (target.compare(0, kHttp.size(), kHttp) == 0) schemeLen = kHttp.size();
    else if (target.compare(0, kHttps.size(), kHttps) == 0) schemeLen = kHttps.size();
    if (schemeLen > 0) {
        size_t slash = target.find_first_of("/?", schemeLen);
        target = (slash == std::string::npos) ? "/" : target.substr(slash);
        if (target[0] == '?') target.insert(0, "/");
    }
    if (target.empty() || (target[0] != '/' && target != "*")) return false;

    const size_t question = target.find('?');
    if (question != std::string::npos) {
        request_.setPath(target.substr(0, question));
        request_.setQuery(target.substr(question + 1));
    } else {
        request_.setPath(target);
    }

    start = space + 1;
    if (end - start != 8 || !std::equal(start, end - 1, "HTTP/1.")) return false;
    if (*(end - 1) == '1') {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (*(end - 1) == '0') {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::processHeadersEnd() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    chunkState_ = kChunkSize;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty()) {
        if (!HeaderHasToken(te, "chunked")) return fail(400);
        chunked_ = true;
        // Transfer-Encoding wins over Content-Length.
        request_.removeHeader("Content-Length");
    } else {
        bool seen = false;
        for (const auto& h : request_.headers()) {
            if (!IEquals(h.first, "Content-Length")) continue;
            size_t v = 0;
            if (!ParseLength(h.second, &v)) return fail(400);
            if (seen && v != bodyRemaining_) return fail(400);
            seen = true;
            bodyRemaining_ = v;
        }
        if (maxBodyBytes_ > 0 && bodyRemaining_ > maxBodyBytes_) return fail(413);
    }

    const bool hasBody = chunked_ || bodyRemaining_ > 0;
    if (hasBody && request_.getVersion() == HttpRequest::kHttp11 &&
        IEquals(TrimCopy(request_.getHeader("Expect")), "100-continue")) {
        expectContinue_ = true;
    }
    state_ = hasBody ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::processChunkedBody(gateway::network::Buffer* buf, bool* hasMore) {
    while (true) {
        if (chunkState_ == kChunkSize) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (buf->ReadableBytes() > 1024) return fail(400);
                *hasMore = false;
                return true;
            }
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);

            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = TrimCopy(line);
            if (line.empty() || line.size() > 15) return fail(400);
            char* endp = nullptr;
            const unsigned long long sz = std::strtoull(line.c_str(), &endp, 16);
            if (endp == line.c_str() || *endp != '\0') return fail(400);
            chunkSize_ = static_cast<size_t>(sz);
            if (maxBodyBytes_ > 0 && request_.body().size() + chunkSize_ > maxBodyBytes_) return fail(413);
            chunkState_ = (chunkSize_ == 0) ? kChunkTrailer : kChunkData;
        } else if (chunkState_ == kChunkData) {
            // Need chunkSize_ bytes + CRLF.
            if (buf->ReadableBytes() < chunkSize_ + 2) {
                *hasMore = false;
                return true;
            }
            request_.appendBody(buf->Peek(), chunkSize_);
            buf->Retrieve(chunkSize_);
            const char* p = buf->Peek();
            if (p[0] != '\r' || p[1] != '\n') return fail(400);
            buf->Retrieve(2);
            chunkState_ = kChunkSize;
        } else {
            // Trailer fields are dropped; an empty line ends the message.
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (buf->ReadableBytes() > maxHeaderBytes_) return fail(431);
                *hasMore = false;
                return true;
            }
            const bool empty = (crlf == buf->Peek());
            buf->RetrieveUntil(crlf + 2);
            if (empty) {
                state_ = kGotAll;
                *hasMore = false;
                return true;
            }
        }
    }
}

// return false if any error
bool HttpContext::parseRequest(gateway::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool hasMore = true;
    while (hasMore) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (buf->ReadableBytes() > maxHeaderBytes_) return fail(431);
                hasMore = false;
                continue;
            }
            // Tolerate stray empty lines between pipelined requests.
            if (crlf == buf->Peek()) {
                buf->Retrieve(2);
                continue;
            }
            if (!processRequestLine(buf->Peek(), crlf)) {
                LOG_DEBUG << "HttpContext: malformed request line";
                return fail(400);
            }
            headerBytes_ = static_cast<size_t>(crlf + 2 - buf->Peek());
            buf->RetrieveUntil(crlf + 2);
            state_ = kExpectHeaders;
        } else if (state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (headerBytes_ + buf->ReadableBytes() > maxHeaderBytes_) return fail(431);
                hasMore = false;
                continue;
            }
            headerBytes_ += static_cast<size_t>(crlf + 2 - buf->Peek());
            if (headerBytes_ > maxHeaderBytes_) return fail(431);

            if (crlf == buf->Peek()) {
                buf->Retrieve(2);
                if (!processHeadersEnd()) return false;
                hasMore = (state_ != kGotAll);
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon == crlf || colon == buf->Peek()) return fail(400);
            request_.addHeader(buf->Peek(), colon, crlf);
            buf->RetrieveUntil(crlf + 2);
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                if (!processChunkedBody(buf, &hasMore)) return false;
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace gateway
