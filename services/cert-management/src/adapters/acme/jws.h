#pragma once

#include <certmgr/pki/types.h>

#include <optional>
#include <string>

/**
 * @file jws.h
 * @brief RS256 JSON Web Signature for ACME requests (RFC 7515, RFC 8555 §6.2)
 */

namespace adapters {

class JwsSigner {
public:
    /**
     * @param accountKeyPem Unencrypted RSA private key PEM
     * @throws common::ProtocolException if the key cannot be loaded
     */
    explicit JwsSigner(const std::string& accountKeyPem);

    /// {"e":...,"kty":"RSA","n":...} with members in lexicographic order
    const std::string& jwk() const { return jwk_; }

    /// base64url(SHA-256(jwk)) as in RFC 7638
    const std::string& thumbprint() const { return thumbprint_; }

    /// base64url(SHA-256(token "." thumbprint)), the dns-01 TXT record value
    std::string dnsTxtValue(const std::string& token) const;

    /**
     * @brief Build a flattened JWS body
     * @param payload JSON text; empty string for POST-as-GET
     * @param kid Account URL; when absent the JWK is embedded instead
     */
    std::string sign(const std::string& url, const std::string& nonce,
                     const std::string& payload, const std::optional<std::string>& kid) const;

private:
    std::string signature(const std::string& input) const;

    certmgr::pki::UniqueKey key_;
    std::string jwk_;
    std::string thumbprint_;
};

} // namespace adapters
