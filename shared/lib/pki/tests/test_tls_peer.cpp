/**
 * @file test_tls_peer.cpp
 * @brief Unit tests for fetching a TLS server's certificate
 *
 * A loopback listener on an ephemeral port stands in for the remote host.
 */

#include <gtest/gtest.h>
#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/tls_peer.h>
#include "test_helpers.h"

#include <openssl/ssl.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <functional>
#include <thread>

using namespace certmgr::pki;

namespace {

/// Listening socket on 127.0.0.1:<ephemeral>; closed on destruction
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 1) != 0) {
            throw std::runtime_error("loopback listener setup failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackListener() { close(); }

    void close() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

    int port() const { return port_; }

    /// Accept one connection on a background thread and hand its fd to @p handler
    std::thread serveOnce(std::function<void(int)> handler) {
        int listenFd = fd_;
        return std::thread([listenFd, handler]() {
            int client = ::accept(listenFd, nullptr, nullptr);
            if (client < 0) return;
            handler(client);
            ::close(client);
        });
    }

private:
    int fd_ = -1;
    int port_ = 0;
};

} // anonymous namespace

class TlsPeerTest : public ::testing::Test {
protected:
    test_helpers::UniqueKey rootKey_;
    test_helpers::UniqueKey leafKey_;
    test_helpers::UniqueCert root_;
    test_helpers::UniqueCert leaf_;

    void SetUp() override {
        rootKey_ = test_helpers::generateRsaKey(2048);
        leafKey_ = test_helpers::generateRsaKey(2048);
        root_ = test_helpers::createRootCa(rootKey_.get(), "Root");
        leaf_ = test_helpers::createLeaf(leafKey_.get(), rootKey_.get(), root_.get(), "localhost");
    }

    /// TLS server side of one connection presenting leaf_
    void serveTls(int fd) {
        SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
        SSL_CTX_use_certificate(ctx, leaf_.get());
        SSL_CTX_use_PrivateKey(ctx, leafKey_.get());
        SSL* ssl = SSL_new(ctx);
        SSL_set_fd(ssl, fd);
        if (SSL_accept(ssl) == 1) {
            SSL_shutdown(ssl);
        }
        SSL_free(ssl);
        SSL_CTX_free(ctx);
    }
};

TEST_F(TlsPeerTest, ReturnsPresentedLeaf) {
    LoopbackListener listener;
    std::thread server = listener.serveOnce([this](int fd) { serveTls(fd); });

    UniqueCert peer = fetchPeerCertificate("127.0.0.1", listener.port());
    server.join();

    ASSERT_NE(peer, nullptr);
    EXPECT_EQ(X509_cmp(peer.get(), leaf_.get()), 0);
    EXPECT_EQ(getSha1Fingerprint(peer.get()), getSha1Fingerprint(leaf_.get()));
}

TEST_F(TlsPeerTest, RefusedConnectionIsNull) {
    int port = 0;
    {
        LoopbackListener listener;
        port = listener.port();
    }
    EXPECT_EQ(fetchPeerCertificate("127.0.0.1", port), nullptr);
}

TEST_F(TlsPeerTest, UnresolvableHostIsNull) {
    EXPECT_EQ(fetchPeerCertificate("host.invalid", 443), nullptr);
}

TEST_F(TlsPeerTest, NonTlsServerThrows) {
    LoopbackListener listener;
    std::thread server = listener.serveOnce([](int fd) {
        const char banner[] = "220 plain text service, not TLS\r\n";
        ::send(fd, banner, sizeof(banner) - 1, 0);
    });

    EXPECT_THROW(fetchPeerCertificate("127.0.0.1", listener.port()), CryptoError);
    server.join();
}
