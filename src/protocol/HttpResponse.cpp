#include "gateway/protocol/HttpResponse.h"

#include <cstdio>
#include <cstring>

namespace gateway {
namespace protocol {

void HttpResponse::appendToBuffer(gateway::network::Buffer* output) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_.empty() ? std::string(ReasonPhrase(statusCode_)) : statusMessage_);
    output->Append("\r\n");

    // 204 and 304 carry neither a body nor a length.
    const bool bodyless = statusCode_ == 204 || statusCode_ == 304 || (statusCode_ >= 100 && statusCode_ < 200);
    if (!bodyless) {
        std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
        output->Append(buf, std::strlen(buf));
    }
    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");

    for (const auto& header : headers_) {
        if (IEquals(header.first, "Content-Length") || IEquals(header.first, "Connection")) continue;
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    if (!bodyless && !suppressBody_) {
        output->Append(body_);
    }
}

} // namespace protocol
} // namespace gateway
