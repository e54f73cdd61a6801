#pragma once

#include "gateway/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace gateway {
namespace network {

// Server-side OpenSSL context for the public listener.
class TlsContext : gateway::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath);
    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    ssl_ctx_st* ctx_{nullptr};
};

} // namespace network
} // namespace gateway
