/**
 * @file test_acme_client.cpp
 * @brief JWS signing and the ACME client over a scripted transport
 */

#include <gtest/gtest.h>
#include "../src/adapters/acme/acme_client.h"
#include "../src/adapters/acme/jws.h"
#include "test_support.h"

#include <certmgr/pki/encoding.h>
#include <certmgr/pki/pem.h>

#include <json/json.h>
#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <sstream>

using test_support::ScriptedHttpTransport;

namespace {

std::string accountKeyPem() {
    static const std::string pem = [] {
        auto key = certmgr::pki::generateRsaKey(2048);
        return certmgr::pki::dumpPrivateKey(key.get());
    }();
    return pem;
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder reader;
    Json::Value value;
    std::string errs;
    std::istringstream iss(text);
    if (!Json::parseFromStream(reader, iss, &value, &errs)) {
        throw std::runtime_error(errs);
    }
    return value;
}

const char* kDirectoryJson = R"({
    "newAccount": "https://acme.test/new-acct",
    "newNonce": "https://acme.test/new-nonce",
    "newOrder": "https://acme.test/new-order",
    "revokeCert": "https://acme.test/revoke-cert",
    "meta": {"termsOfService": "https://acme.test/terms.pdf"}
})";

domain::models::AcmeRegistration account() {
    domain::models::AcmeRegistration a;
    a.uri = "https://acme.test/acct/7";
    a.newNonceUri = "https://acme.test/new-nonce";
    a.newOrderUri = "https://acme.test/new-order";
    a.revokeCertUri = "https://acme.test/revoke-cert";
    a.privateKeyPem = accountKeyPem();
    return a;
}

std::string base64UrlDecode(std::string text) {
    std::replace(text.begin(), text.end(), '-', '+');
    std::replace(text.begin(), text.end(), '_', '/');
    size_t padding = 0;
    while (text.size() % 4 != 0) {
        text += '=';
        ++padding;
    }
    std::string out(text.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (n < 0) throw std::runtime_error("invalid base64url");
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

/// Decoded JSON payload of a flattened JWS request body
Json::Value jwsPayload(const std::string& body) {
    return parseJson(base64UrlDecode(parseJson(body)["payload"].asString()));
}

domain::models::AcmeOrder pendingOrder() {
    domain::models::AcmeOrder order;
    order.uri = "https://acme.test/order/1";
    order.status = "pending";
    order.finalizeUri = "https://acme.test/order/1/finalize";
    order.identifiers = {"a.example.com"};
    order.authorizationUris = {"https://acme.test/authz/1"};
    return order;
}

const std::map<std::string, std::string> kNonce = {{"replay-nonce", "n"}};

const char* kValidAuthorization = R"({
    "identifier": {"type": "dns", "value": "a.example.com"},
    "status": "valid",
    "challenges": []
})";

} // anonymous namespace

// ============================================================================
// JWS
// ============================================================================

TEST(JwsSignerTest, JwkMembersInThumbprintOrder) {
    adapters::JwsSigner signer(accountKeyPem());

    EXPECT_EQ(signer.jwk().rfind(R"({"e":"AQAB","kty":"RSA","n":")", 0), 0u);
    EXPECT_EQ(signer.jwk().find(' '), std::string::npos);
    EXPECT_EQ(signer.thumbprint(), certmgr::pki::base64UrlEncode(certmgr::pki::sha256(signer.jwk())));
    EXPECT_EQ(signer.thumbprint().size(), 43u);
}

TEST(JwsSignerTest, DnsTxtValueIsKeyAuthorizationDigest) {
    adapters::JwsSigner signer(accountKeyPem());
    std::string expected = certmgr::pki::base64UrlEncode(
        certmgr::pki::sha256("token-1." + signer.thumbprint()));
    EXPECT_EQ(signer.dnsTxtValue("token-1"), expected);
}

TEST(JwsSignerTest, FlattenedBodyWithKidOrJwk) {
    adapters::JwsSigner signer(accountKeyPem());

    Json::Value withKid = parseJson(signer.sign("https://acme.test/x", "n1", "{}", std::string("kid-url")));
    EXPECT_TRUE(withKid.isMember("protected"));
    EXPECT_FALSE(withKid["payload"].asString().empty());
    EXPECT_FALSE(withKid["signature"].asString().empty());

    Json::Value postAsGet = parseJson(signer.sign("https://acme.test/x", "n1", "", std::nullopt));
    EXPECT_EQ(postAsGet["payload"].asString(), "");
    EXPECT_NE(postAsGet["protected"].asString(), withKid["protected"].asString());
}

TEST(JwsSignerTest, GarbageKeyRejected) {
    EXPECT_THROW(adapters::JwsSigner("not a key"), common::ProtocolException);
}

// ============================================================================
// Client
// ============================================================================

TEST(AcmeClientTest, FetchDirectory) {
    ScriptedHttpTransport transport;
    transport.enqueue(200, kDirectoryJson);
    adapters::AcmeClient client(&transport);

    auto directory = client.fetchDirectory("https://acme.test/directory/");

    EXPECT_EQ(directory.newOrder, "https://acme.test/new-order");
    EXPECT_EQ(directory.termsOfService, "https://acme.test/terms.pdf");
    ASSERT_EQ(transport.requests.size(), 1u);
    EXPECT_EQ(transport.requests[0].method, "GET");
}

TEST(AcmeClientTest, DirectoryMissingEndpointRejected) {
    ScriptedHttpTransport transport;
    transport.enqueue(200, R"({"newAccount": "https://acme.test/new-acct"})");
    adapters::AcmeClient client(&transport);

    EXPECT_THROW(client.fetchDirectory("https://acme.test/directory/"), common::ProtocolException);
}

TEST(AcmeClientTest, RegisterAccountReturnsLocation) {
    ScriptedHttpTransport transport;
    transport.enqueue(200, "", {{"replay-nonce", "n1"}});
    transport.enqueue(201, "{}", {{"replay-nonce", "n2"}, {"location", "https://acme.test/acct/7"}});
    adapters::AcmeClient client(&transport);

    domain::models::AcmeDirectory directory;
    directory.newAccount = "https://acme.test/new-acct";
    directory.newNonce = "https://acme.test/new-nonce";

    EXPECT_EQ(client.registerAccount(directory, accountKeyPem(), true), "https://acme.test/acct/7");
    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(transport.requests[0].method, "HEAD");
    EXPECT_EQ(transport.requests[1].url, "https://acme.test/new-acct");
}

TEST(AcmeClientTest, BadNonceRetriedOnceWithPooledNonce) {
    ScriptedHttpTransport transport;
    transport.enqueue(200, "", {{"replay-nonce", "n1"}});
    transport.enqueue(400, R"({"type": "urn:ietf:params:acme:error:badNonce", "detail": "stale"})",
                      {{"replay-nonce", "n2"}});
    transport.enqueue(201, R"({
        "status": "pending",
        "finalize": "https://acme.test/order/1/finalize",
        "authorizations": ["https://acme.test/authz/1"],
        "identifiers": [{"type": "dns", "value": "a.example.com"}]
    })", {{"location", "https://acme.test/order/1"}});
    adapters::AcmeClient client(&transport);

    auto order = client.newOrder(account(), {"a.example.com"});

    EXPECT_EQ(order.uri, "https://acme.test/order/1");
    EXPECT_EQ(order.finalizeUri, "https://acme.test/order/1/finalize");
    ASSERT_EQ(order.identifiers.size(), 1u);
    EXPECT_EQ(order.identifiers[0], "a.example.com");
    // HEAD, rejected POST, retried POST; the retry uses the nonce from the rejection
    ASSERT_EQ(transport.requests.size(), 3u);
    EXPECT_EQ(transport.requests[2].method, "POST");
}

TEST(AcmeClientTest, ProblemDocumentBecomesProtocolError) {
    ScriptedHttpTransport transport;
    transport.enqueue(200, "", {{"replay-nonce", "n1"}});
    transport.enqueue(403, R"({"type": "urn:ietf:params:acme:error:unauthorized", "detail": "account deactivated"})");
    adapters::AcmeClient client(&transport);

    try {
        client.newOrder(account(), {"a.example.com"});
        FAIL() << "expected ProtocolException";
    } catch (const common::ProtocolException& e) {
        EXPECT_EQ(std::string(e.what()), "urn:ietf:params:acme:error:unauthorized: account deactivated");
    }
}

TEST(AcmeClientTest, AuthorizationParsed) {
    ScriptedHttpTransport transport;
    transport.enqueue(200, "", {{"replay-nonce", "n1"}});
    transport.enqueue(200, R"({
        "identifier": {"type": "dns", "value": "b.example.com"},
        "status": "pending",
        "wildcard": true,
        "challenges": [
            {"type": "http-01", "url": "https://acme.test/chall/1", "token": "t1", "status": "pending"},
            {"type": "dns-01", "url": "https://acme.test/chall/2", "token": "t2", "status": "pending"}
        ]
    })");
    adapters::AcmeClient client(&transport);

    auto authz = client.fetchAuthorization(account(), "https://acme.test/authz/1");

    EXPECT_EQ(authz.identifier, "b.example.com");
    EXPECT_TRUE(authz.wildcard);
    ASSERT_EQ(authz.challenges.size(), 2u);
    EXPECT_EQ(authz.challenges[1].token, "t2");
}

// ============================================================================
// Finalization
// ============================================================================

TEST(AcmeClientTest, Finalize_SubmitsCsrDerAndDownloadsChain) {
    auto csr = test_support::makeCsrRecord("request", "a.example.com");
    const std::string chain = test_support::makeLeafPem("a.example.com", 90);

    ScriptedHttpTransport transport;
    transport.enqueue(200, "", kNonce);
    transport.enqueue(200, kValidAuthorization, kNonce);
    transport.enqueue(200, R"({"status": "valid", "certificate": "https://acme.test/cert/1"})", kNonce);
    transport.enqueue(200, chain, kNonce);
    adapters::AcmeClient client(&transport, std::chrono::milliseconds(1));

    auto result = client.pollAndFinalize(account(), pendingOrder(), *csr.csr, std::chrono::seconds(5));

    EXPECT_EQ(result.uri, "https://acme.test/order/1");
    EXPECT_EQ(result.fullchainPem, chain);

    ASSERT_EQ(transport.requests.size(), 4u);
    EXPECT_EQ(transport.requests[2].url, "https://acme.test/order/1/finalize");
    EXPECT_EQ(transport.requests[3].url, "https://acme.test/cert/1");

    auto req = certmgr::pki::loadCertificateRequest(*csr.csr);
    ASSERT_TRUE(req);
    Json::Value payload = jwsPayload(transport.requests[2].body);
    EXPECT_EQ(payload["csr"].asString(),
              certmgr::pki::base64UrlEncode(certmgr::pki::certificateRequestToDer(req.get())));
    EXPECT_EQ(payload.getMemberNames().size(), 1u);
}

TEST(AcmeClientTest, Finalize_PendingAuthorizationTimesOut) {
    auto csr = test_support::makeCsrRecord("request", "a.example.com");

    ScriptedHttpTransport transport;
    transport.enqueue(200, "", kNonce);
    transport.enqueue(200, R"({
        "identifier": {"type": "dns", "value": "a.example.com"},
        "status": "pending",
        "challenges": []
    })", kNonce);
    adapters::AcmeClient client(&transport, std::chrono::milliseconds(1));

    try {
        client.pollAndFinalize(account(), pendingOrder(), *csr.csr, std::chrono::seconds(0));
        FAIL() << "expected TimeoutException";
    } catch (const common::TimeoutException& e) {
        EXPECT_EQ(std::string(e.what()), "Certificate request for final order timed out");
    }
    // No finalize request was sent
    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(transport.requests[1].url, "https://acme.test/authz/1");
}

TEST(AcmeClientTest, Finalize_ProcessingOrderTimesOut) {
    auto csr = test_support::makeCsrRecord("request", "a.example.com");

    ScriptedHttpTransport transport;
    transport.enqueue(200, "", kNonce);
    transport.enqueue(200, kValidAuthorization, kNonce);
    transport.enqueue(200, R"({"status": "processing"})", kNonce);
    adapters::AcmeClient client(&transport, std::chrono::milliseconds(1));

    EXPECT_THROW(client.pollAndFinalize(account(), pendingOrder(), *csr.csr, std::chrono::seconds(0)),
                 common::TimeoutException);
}

TEST(AcmeClientTest, Finalize_InvalidOrderRaisesProtocolError) {
    auto csr = test_support::makeCsrRecord("request", "a.example.com");

    ScriptedHttpTransport transport;
    transport.enqueue(200, "", kNonce);
    transport.enqueue(200, kValidAuthorization, kNonce);
    transport.enqueue(200, R"({"status": "processing"})", kNonce);
    transport.enqueue(200, R"({"status": "invalid"})", kNonce);
    adapters::AcmeClient client(&transport, std::chrono::milliseconds(1));

    try {
        client.pollAndFinalize(account(), pendingOrder(), *csr.csr, std::chrono::seconds(5));
        FAIL() << "expected ProtocolException";
    } catch (const common::ProtocolException& e) {
        EXPECT_EQ(std::string(e.what()), "Order https://acme.test/order/1 became invalid");
    }
    ASSERT_EQ(transport.requests.size(), 4u);
    EXPECT_EQ(transport.requests[3].url, "https://acme.test/order/1");
}

TEST(AcmeClientTest, Finalize_InvalidAuthorizationRaisesProtocolError) {
    auto csr = test_support::makeCsrRecord("request", "a.example.com");

    ScriptedHttpTransport transport;
    transport.enqueue(200, "", kNonce);
    transport.enqueue(200, R"({
        "identifier": {"type": "dns", "value": "a.example.com"},
        "status": "invalid",
        "challenges": []
    })", kNonce);
    adapters::AcmeClient client(&transport, std::chrono::milliseconds(1));

    try {
        client.pollAndFinalize(account(), pendingOrder(), *csr.csr, std::chrono::seconds(5));
        FAIL() << "expected ProtocolException";
    } catch (const common::ProtocolException& e) {
        EXPECT_EQ(std::string(e.what()), "Authorization for a.example.com is invalid");
    }
}

TEST(AcmeClientTest, NullTransportRejected) {
    EXPECT_THROW(adapters::AcmeClient(nullptr), std::invalid_argument);
}
