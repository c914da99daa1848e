/**
 * @file tls_peer.cpp
 * @brief Peer certificate retrieval over an OpenSSL connect BIO chain
 */

#include "certmgr/pki/tls_peer.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace certmgr::pki {

namespace {

struct SslCtxDeleter { void operator()(SSL_CTX* c) const { SSL_CTX_free(c); } };
using UniqueSslCtx = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

std::string lastSslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // anonymous namespace

UniqueCert fetchPeerCertificate(const std::string& host, int port) {
    UniqueSslCtx ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        throw CryptoError("Failed to create TLS client context: " + lastSslError());
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

    // Plain TCP first, so resolution and connect failures are told apart from TLS ones
    const std::string target = host + ":" + std::to_string(port);
    UniqueBio connection(BIO_new_connect(target.c_str()));
    if (!connection) {
        throw CryptoError("Failed to create connect BIO: " + lastSslError());
    }
    if (BIO_do_connect(connection.get()) <= 0) {
        ERR_clear_error();
        return nullptr;
    }

    UniqueBio tls(BIO_new_ssl(ctx.get(), 1));
    if (!tls) {
        throw CryptoError("Failed to create TLS BIO: " + lastSslError());
    }
    SSL* ssl = nullptr;
    BIO_get_ssl(tls.get(), &ssl);
    if (!ssl) {
        throw CryptoError("TLS BIO has no SSL object");
    }
    SSL_set_tlsext_host_name(ssl, host.c_str());

    // The TLS BIO owns the connection from here on
    BIO_push(tls.get(), connection.release());

    if (BIO_do_handshake(tls.get()) <= 0) {
        throw CryptoError("TLS handshake with " + target + " failed: " + lastSslError());
    }

    UniqueCert peer(SSL_get1_peer_certificate(ssl));
    if (!peer) {
        throw CryptoError(target + " presented no certificate");
    }
    return peer;
}

} // namespace certmgr::pki
