#include "streamgate/network/TlsContext.h"
#include "streamgate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace streamgate {
namespace network {

namespace {

std::string LastSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof buf);
    return buf;
}

} // namespace

TlsContext::TlsContext() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

bool TlsContext::InitServer(const std::string& certPemPath, const std::string& keyPemPath) {
    if (certPemPath.empty() || keyPemPath.empty()) return false;

    SSL_CTX* c = SSL_CTX_new(TLS_server_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastSslError();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
    // Streaming responses are written in pieces; let OpenSSL retry with a moved buffer.
    SSL_CTX_set_mode(c, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER | SSL_MODE_ENABLE_PARTIAL_WRITE);

    if (SSL_CTX_use_certificate_chain_file(c, certPemPath.c_str()) != 1) {
        LOG_ERROR << "TLS: load cert failed: " << certPemPath << ": " << LastSslError();
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(c, keyPemPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        LOG_ERROR << "TLS: load key failed: " << keyPemPath << ": " << LastSslError();
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_check_private_key(c) != 1) {
        LOG_ERROR << "TLS: key does not match cert";
        SSL_CTX_free(c);
        return false;
    }

    if (ctx_) SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    LOG_INFO << "TLS enabled with certificate " << certPemPath;
    return true;
}

} // namespace network
} // namespace streamgate
