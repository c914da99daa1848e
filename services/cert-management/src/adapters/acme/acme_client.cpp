/**
 * @file acme_client.cpp
 * @brief AcmeClient implementation
 */

#include "acme_client.h"
#include "exceptions.h"

#include <certmgr/pki/encoding.h>
#include <certmgr/pki/pem.h>

#include <sstream>
#include <stdexcept>
#include <thread>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace adapters {

using domain::models::AcmeAuthorization;
using domain::models::AcmeChallenge;
using domain::models::AcmeDirectory;
using domain::models::AcmeOrder;
using domain::models::AcmeRegistration;
using domain::models::FinalOrder;
namespace pki = certmgr::pki;

namespace {

constexpr const char* kJoseContentType = "application/jose+json";
constexpr const char* kBadNonce = "urn:ietf:params:acme:error:badNonce";

Json::Value parseJson(const std::string& text, const std::string& what) {
    Json::CharReaderBuilder reader;
    Json::Value value;
    std::string errs;
    std::istringstream iss(text);
    if (!Json::parseFromStream(reader, iss, &value, &errs)) {
        throw common::ProtocolException("Malformed " + what + " response: " + errs);
    }
    return value;
}

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

/// "type: detail" from an RFC 7807 problem document, or the raw body
std::string problemDetail(const HttpResponse& response) {
    Json::CharReaderBuilder reader;
    Json::Value problem;
    std::string errs;
    std::istringstream iss(response.body);
    if (Json::parseFromStream(reader, iss, &problem, &errs) && problem.isObject()) {
        std::string type = problem.get("type", "").asString();
        std::string detail = problem.get("detail", "").asString();
        if (!type.empty() || !detail.empty()) {
            return type.empty() ? detail : type + ": " + detail;
        }
    }
    return "HTTP " + std::to_string(response.status) + " " + response.body;
}

bool isBadNonce(const HttpResponse& response) {
    if (response.status != 400) return false;
    Json::CharReaderBuilder reader;
    Json::Value problem;
    std::string errs;
    std::istringstream iss(response.body);
    return Json::parseFromStream(reader, iss, &problem, &errs) &&
           problem.isObject() && problem.get("type", "").asString() == kBadNonce;
}

void requireField(const Json::Value& json, const char* key, const std::string& what) {
    if (!json.isObject() || !json.isMember(key)) {
        throw common::ProtocolException(what + " response lacks \"" + key + "\"");
    }
}

} // anonymous namespace

AcmeClient::AcmeClient(IHttpTransport* transport, std::chrono::milliseconds pollInterval)
    : transport_(transport), pollInterval_(pollInterval)
{
    if (!transport_) {
        throw std::invalid_argument("AcmeClient: transport cannot be nullptr");
    }
}

// =============================================================================
// Nonces
// =============================================================================

std::string AcmeClient::takeNonce(const std::string& newNonceUri) {
    {
        std::lock_guard<std::mutex> lock(nonceMutex_);
        auto& pool = nonces_[newNonceUri];
        if (!pool.empty()) {
            std::string nonce = pool.back();
            pool.pop_back();
            return nonce;
        }
    }

    HttpResponse response = transport_->head(newNonceUri);
    std::string nonce = response.header("Replay-Nonce");
    if (nonce.empty()) {
        throw common::ProtocolException("ACME server returned no Replay-Nonce from " + newNonceUri);
    }
    return nonce;
}

void AcmeClient::keepNonce(const std::string& newNonceUri, const HttpResponse& response) {
    std::string nonce = response.header("Replay-Nonce");
    if (nonce.empty()) return;
    std::lock_guard<std::mutex> lock(nonceMutex_);
    nonces_[newNonceUri].push_back(std::move(nonce));
}

// =============================================================================
// Signed requests
// =============================================================================

HttpResponse AcmeClient::signedPost(const JwsSigner& signer, const std::string& newNonceUri,
                                    const std::string& url, const std::string& payload,
                                    const std::optional<std::string>& kid) {
    HttpResponse response;
    for (int attempt = 0; attempt < 2; ++attempt) {
        std::string body = signer.sign(url, takeNonce(newNonceUri), payload, kid);
        response = transport_->post(url, body, kJoseContentType);
        keepNonce(newNonceUri, response);

        if (!isBadNonce(response)) break;
        spdlog::debug("[AcmeClient] badNonce from {}, retrying", url);
    }

    if (response.status >= 400) {
        throw common::ProtocolException(problemDetail(response));
    }
    return response;
}

HttpResponse AcmeClient::postAsGet(const AcmeRegistration& account, const std::string& url) {
    JwsSigner signer(account.privateKeyPem);
    return signedPost(signer, account.newNonceUri, url, "", account.uri);
}

// =============================================================================
// Account
// =============================================================================

AcmeDirectory AcmeClient::fetchDirectory(const std::string& directoryUri) {
    HttpResponse response = transport_->get(directoryUri);
    if (response.status >= 400) {
        throw common::ProtocolException("Unable to fetch ACME directory " + directoryUri + ": " +
                                        problemDetail(response));
    }

    Json::Value json = parseJson(response.body, "directory");
    for (const char* key : {"newAccount", "newNonce", "newOrder", "revokeCert"}) {
        requireField(json, key, "Directory");
    }

    AcmeDirectory directory;
    directory.newAccount = json["newAccount"].asString();
    directory.newNonce = json["newNonce"].asString();
    directory.newOrder = json["newOrder"].asString();
    directory.revokeCert = json["revokeCert"].asString();
    if (json.isMember("meta") && json["meta"].isObject()) {
        directory.termsOfService = json["meta"].get("termsOfService", "").asString();
    }
    return directory;
}

std::string AcmeClient::registerAccount(const AcmeDirectory& directory,
                                        const std::string& accountKeyPem, bool termsAgreed) {
    JwsSigner signer(accountKeyPem);

    Json::Value payload(Json::objectValue);
    payload["termsOfServiceAgreed"] = termsAgreed;

    HttpResponse response = signedPost(signer, directory.newNonce, directory.newAccount,
                                       compactJson(payload), std::nullopt);
    std::string location = response.header("Location");
    if (location.empty()) {
        throw common::ProtocolException("ACME account registration returned no Location");
    }
    spdlog::info("[AcmeClient] Account registered: {}", location);
    return location;
}

// =============================================================================
// Orders and authorizations
// =============================================================================

AcmeOrder AcmeClient::parseOrder(const std::string& uri, const std::string& body) const {
    Json::Value json = parseJson(body, "order");
    requireField(json, "status", "Order");

    AcmeOrder order;
    order.uri = uri;
    order.status = json["status"].asString();
    order.finalizeUri = json.get("finalize", "").asString();
    order.certificateUri = json.get("certificate", "").asString();
    for (const auto& authz : json["authorizations"]) {
        order.authorizationUris.push_back(authz.asString());
    }
    for (const auto& identifier : json["identifiers"]) {
        order.identifiers.push_back(identifier.get("value", "").asString());
    }
    return order;
}

AcmeOrder AcmeClient::newOrder(const AcmeRegistration& account, const std::vector<std::string>& domains) {
    Json::Value identifiers(Json::arrayValue);
    for (const auto& domain : domains) {
        Json::Value identifier(Json::objectValue);
        identifier["type"] = "dns";
        identifier["value"] = domain;
        identifiers.append(identifier);
    }
    Json::Value payload(Json::objectValue);
    payload["identifiers"] = identifiers;

    JwsSigner signer(account.privateKeyPem);
    HttpResponse response = signedPost(signer, account.newNonceUri, account.newOrderUri,
                                       compactJson(payload), account.uri);

    AcmeOrder order = parseOrder(response.header("Location"), response.body);
    if (order.finalizeUri.empty()) {
        throw common::ProtocolException("Order response lacks \"finalize\"");
    }
    return order;
}

AcmeAuthorization AcmeClient::fetchAuthorization(const AcmeRegistration& account, const std::string& url) {
    HttpResponse response = postAsGet(account, url);
    Json::Value json = parseJson(response.body, "authorization");
    requireField(json, "identifier", "Authorization");

    AcmeAuthorization authz;
    authz.url = url;
    authz.identifier = json["identifier"].get("value", "").asString();
    authz.wildcard = json.get("wildcard", false).asBool();
    authz.status = json.get("status", "").asString();
    for (const auto& c : json["challenges"]) {
        AcmeChallenge challenge;
        challenge.type = c.get("type", "").asString();
        challenge.url = c.get("url", "").asString();
        challenge.token = c.get("token", "").asString();
        challenge.status = c.get("status", "").asString();
        authz.challenges.push_back(std::move(challenge));
    }
    return authz;
}

std::string AcmeClient::dnsTxtValue(const AcmeRegistration& account, const std::string& token) {
    return JwsSigner(account.privateKeyPem).dnsTxtValue(token);
}

void AcmeClient::answerChallenge(const AcmeRegistration& account, const AcmeChallenge& challenge) {
    JwsSigner signer(account.privateKeyPem);
    signedPost(signer, account.newNonceUri, challenge.url, "{}", account.uri);
}

// =============================================================================
// Finalization
// =============================================================================

FinalOrder AcmeClient::pollAndFinalize(const AcmeRegistration& account, const AcmeOrder& order,
                                       const std::string& csrPem, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto waitOrTimeout = [&]() {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw common::TimeoutException("Certificate request for final order timed out");
        }
        std::this_thread::sleep_for(pollInterval_);
    };

    // --- Authorizations must all turn valid ---
    for (const auto& url : order.authorizationUris) {
        for (;;) {
            AcmeAuthorization authz = fetchAuthorization(account, url);
            if (authz.status == "valid") break;
            if (authz.status != "pending" && authz.status != "processing") {
                throw common::ProtocolException("Authorization for " + authz.identifier + " is " + authz.status);
            }
            waitOrTimeout();
        }
    }

    // --- Submit CSR ---
    pki::UniqueReq req = pki::loadCertificateRequest(csrPem);
    if (!req) {
        throw common::ProtocolException("CSR for finalization is not valid");
    }
    std::string csrDer;
    try {
        csrDer = pki::base64UrlEncode(pki::certificateRequestToDer(req.get()));
    } catch (const pki::CryptoError& e) {
        throw common::ProtocolException(std::string("CSR encoding failed: ") + e.what());
    }

    Json::Value payload(Json::objectValue);
    payload["csr"] = csrDer;

    JwsSigner signer(account.privateKeyPem);
    HttpResponse finalized = signedPost(signer, account.newNonceUri, order.finalizeUri,
                                        compactJson(payload), account.uri);
    AcmeOrder current = parseOrder(order.uri, finalized.body);

    // --- Poll the order until the certificate is issued ---
    while (current.status != "valid") {
        if (current.status == "invalid") {
            throw common::ProtocolException("Order " + order.uri + " became invalid");
        }
        waitOrTimeout();
        current = parseOrder(order.uri, postAsGet(account, order.uri).body);
    }
    if (current.certificateUri.empty()) {
        throw common::ProtocolException("Valid order " + order.uri + " has no certificate URL");
    }

    FinalOrder result;
    result.uri = order.uri;
    result.fullchainPem = postAsGet(account, current.certificateUri).body;
    return result;
}

void AcmeClient::revokeCertificate(const AcmeRegistration& account, const std::string& certificatePem,
                                   int reason) {
    pki::UniqueCert cert = pki::loadCertificate(certificatePem);
    if (!cert) {
        throw common::ProtocolException("Certificate to revoke is not valid");
    }

    Json::Value payload(Json::objectValue);
    try {
        payload["certificate"] = pki::base64UrlEncode(pki::certificateToDer(cert.get()));
    } catch (const pki::CryptoError& e) {
        throw common::ProtocolException(std::string("Certificate encoding failed: ") + e.what());
    }
    payload["reason"] = reason;

    JwsSigner signer(account.privateKeyPem);
    signedPost(signer, account.newNonceUri, account.revokeCertUri, compactJson(payload), account.uri);
    spdlog::info("[AcmeClient] Certificate revoked via {}", account.revokeCertUri);
}

} // namespace adapters
