/**
 * @file types.h
 * @brief Common types for the certmgr PKI library
 *
 * RAII handles for OpenSSL objects, subject descriptions and the error type
 * raised by builders. Parsers never throw; they return nullptr or
 * std::nullopt for malformed input.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace certmgr::pki {

/// Raised when OpenSSL refuses to build, sign or serialize an object
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// --- RAII handles ---

struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

struct X509ReqDeleter { void operator()(X509_REQ* p) const { X509_REQ_free(p); } };
using UniqueReq = std::unique_ptr<X509_REQ, X509ReqDeleter>;

struct BioDeleter { void operator()(BIO* p) const { BIO_free_all(p); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

/**
 * @brief Subject attributes of a certificate or signing request
 *
 * Missing attributes are std::nullopt. @c san holds bare values
 * ("www.example.com", "10.0.0.1") in document order.
 */
struct SubjectFields {
    std::optional<std::string> country;
    std::optional<std::string> state;
    std::optional<std::string> city;
    std::optional<std::string> organization;
    std::optional<std::string> organizationalUnit;
    std::optional<std::string> commonName;
    std::optional<std::string> email;
    std::vector<std::string> san;
};

/// Result of decoding an existing certificate
struct CertificateInfo {
    SubjectFields subject;
    std::optional<int64_t> serial;          ///< nullopt when it does not fit 64 bits
    std::optional<std::string> digestAlgorithm;  ///< e.g. "SHA256"
};

/// Why a private key could not be loaded
enum class KeyLoadError {
    BadPassphrase,  ///< Encrypted key, passphrase missing or wrong
    Malformed       ///< Not a decodable private key
};

struct KeyLoadResult {
    UniqueKey key;
    std::optional<KeyLoadError> error;

    bool ok() const { return key != nullptr; }
};

} // namespace certmgr::pki
