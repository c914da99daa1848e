/**
 * @file acme_models.h
 * @brief Domain Models - ACME registrations, DNS authenticators, issuance results
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace domain {
namespace models {

/**
 * @brief ACME account registered against one directory
 *
 * The account key is stored as an unencrypted PKCS#8 PEM.
 */
struct AcmeRegistration {
    int64_t id = 0;
    std::string uri;                ///< Account URL (JWS "kid")
    std::string directory;          ///< Directory URI, always ends with '/'
    std::string tos;                ///< Terms of service URL, may be empty
    std::string newAccountUri;
    std::string newNonceUri;
    std::string newOrderUri;
    std::string revokeCertUri;
    std::string status;             ///< "valid", "deactivated", ...
    std::string contact;
    std::string privateKeyPem;
};

/// Endpoints advertised by an ACME directory
struct AcmeDirectory {
    std::string newAccount;
    std::string newNonce;
    std::string newOrder;
    std::string revokeCert;
    std::string termsOfService;
};

/**
 * @brief Configured DNS authenticator (provider credentials)
 */
struct DnsAuthenticator {
    int64_t id = 0;
    std::string name;
    std::string authenticator;      ///< Backend type, e.g. "route53"
    Json::Value attributes = Json::Value(Json::objectValue);
};

/// One challenge offered by an authorization
struct AcmeChallenge {
    std::string type;               ///< "dns-01", "http-01", ...
    std::string url;
    std::string token;
    std::string status;
};

struct AcmeAuthorization {
    std::string url;
    std::string identifier;         ///< Domain without "*." prefix
    bool wildcard = false;
    std::string status;
    std::vector<AcmeChallenge> challenges;
};

struct AcmeOrder {
    std::string uri;                ///< Order URL (Location header)
    std::string status;
    std::string finalizeUri;
    std::string certificateUri;
    std::vector<std::string> authorizationUris;
    std::vector<std::string> identifiers;
};

/// Result of a completed issuance
struct FinalOrder {
    std::string uri;
    std::string fullchainPem;
    int64_t registrationId = 0;     ///< Account the order was placed with
};

} // namespace models
} // namespace domain
