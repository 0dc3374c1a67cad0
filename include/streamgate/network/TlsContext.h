#pragma once

#include "streamgate/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace streamgate {
namespace network {

// Server-side OpenSSL context shared by all TLS connections of a listener.
class TlsContext : streamgate::common::noncopyable {
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
} // namespace streamgate
