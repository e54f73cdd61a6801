#pragma once

#include <string>

#include "gateway/network/Buffer.h"
#include "gateway/protocol/HttpHeaders.h"

namespace gateway {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k204NoContent = 204,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k413PayloadTooLarge = 413,
        k431HeaderTooLarge = 431,
        k500InternalServerError = 500,
        k503ServiceUnavailable = 503,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(kUnknown), closeConnection_(close) {}

    // Sets the reason phrase to the standard one as well.
    void setStatusCode(int code) {
        statusCode_ = code;
        statusMessage_ = ReasonPhrase(code);
    }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }

    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }

    // HEAD: headers (including Content-Length) are written, the body is not.
    void setSuppressBody(bool on) { suppressBody_ = on; }

    void setContentType(const std::string& contentType) { setHeader("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }
    void setHeader(const std::string& key, const std::string& value) {
        RemoveHeader(&headers_, key);
        headers_.emplace_back(key, value);
    }
    std::string getHeader(const std::string& key) const {
        const std::string* v = FindHeader(headers_, key);
        return v ? *v : std::string();
    }
    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    void setJsonBody(int code, const std::string& json) {
        setStatusCode(code);
        setContentType("application/json");
        setBody(json);
    }

    // Content-Length and Connection are always generated here; handlers must
    // not set them.
    void appendToBuffer(gateway::network::Buffer* output) const;

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool suppressBody_{false};
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace gateway
