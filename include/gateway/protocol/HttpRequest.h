#pragma once

#include "gateway/protocol/HttpHeaders.h"

#include <cctype>
#include <cstddef>
#include <string>

namespace gateway {
namespace protocol {

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kPatch, kOptions, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Any RFC 7230 token is accepted; unknown ones become kOther.
    bool setMethod(const char* start, const char* end) {
        methodText_.assign(start, end);
        if (methodText_.empty()) {
            method_ = kInvalid;
            return false;
        }
        for (unsigned char c : methodText_) {
            if (!std::isalpha(c) && c != '-' && c != '_') {
                method_ = kInvalid;
                return false;
            }
        }
        if (methodText_ == "GET") method_ = kGet;
        else if (methodText_ == "POST") method_ = kPost;
        else if (methodText_ == "HEAD") method_ = kHead;
        else if (methodText_ == "PUT") method_ = kPut;
        else if (methodText_ == "DELETE") method_ = kDelete;
        else if (methodText_ == "PATCH") method_ = kPatch;
        else if (methodText_ == "OPTIONS") method_ = kOptions;
        else method_ = kOther;
        return true;
    }

    void setMethod(Method m) {
        method_ = m;
        methodText_ = methodName(m);
    }

    Method getMethod() const { return method_; }
    const char* methodString() const {
        return method_ == kOther ? methodText_.c_str() : methodName(method_);
    }

    static const char* methodName(Method m) {
        switch (m) {
            case kGet: return "GET";
            case kPost: return "POST";
            case kHead: return "HEAD";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            case kPatch: return "PATCH";
            case kOptions: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    // Raw query string without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    void setQuery(const std::string& query) { query_ = query; }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
            value.pop_back();
        }
        headers_.emplace_back(std::move(field), std::move(value));
    }

    void addHeader(const std::string& field, const std::string& value) {
        headers_.emplace_back(field, value);
    }

    // First value of the field, case-insensitive; empty when absent.
    std::string getHeader(const std::string& field) const {
        const std::string* v = FindHeader(headers_, field);
        return v ? *v : std::string();
    }

    bool hasHeader(const std::string& field) const { return FindHeader(headers_, field) != nullptr; }

    void setHeader(const std::string& field, const std::string& value) {
        RemoveHeader(&headers_, field);
        headers_.emplace_back(field, value);
    }

    void removeHeader(const std::string& field) { RemoveHeader(&headers_, field); }

    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        methodText_.swap(that.methodText_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    Method method_;
    Version version_;
    std::string methodText_;
    std::string path_;
    std::string query_;
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace gateway
