/**
 * @file cert_builder.h
 * @brief Key generation, certificate/CSR construction and signing
 *
 * Builders throw CryptoError when OpenSSL rejects an input (unknown digest,
 * malformed extension value, signing failure).
 *
 * Typical internal-CA flow:
 * @code
 *   auto key = generateRsaKey(2048);
 *   auto cert = createCertificate(subject, key.get(), 3650);
 *   addExtension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE");
 *   setSerialNumber(cert.get(), 1);
 *   signCertificate(cert.get(), key.get(), "SHA256");
 * @endcode
 *
 * @date 2026-02-18
 */

#pragma once

#include "certmgr/pki/types.h"

#include <cstdint>
#include <string>

namespace certmgr::pki {

/// Digest algorithms accepted for signing
inline constexpr const char* kSupportedDigests[] = {"SHA1", "SHA224", "SHA256", "SHA384", "SHA512"};

/**
 * @brief Generate an RSA keypair (public exponent 65537)
 * @throws CryptoError on generation failure
 */
UniqueKey generateRsaKey(int bits);

/**
 * @brief Resolve "SHA256" / "sha256" to an OpenSSL digest
 * @throws CryptoError for unknown names
 */
const EVP_MD* digestByName(const std::string& name);

/**
 * @brief Build an unsigned v3 certificate
 *
 * Subject is C/ST/L/O/[OU]/CN/emailAddress from @p subject, with a
 * subjectAltName extension when @p subject.san is not empty. The issuer is
 * initially the subject itself; notBefore is now and notAfter is now plus
 * @p lifetimeDays.
 *
 * @param publicKey Key whose public half is embedded (non-owning)
 */
UniqueCert createCertificate(const SubjectFields& subject, EVP_PKEY* publicKey, int lifetimeDays);

/**
 * @brief Build a CSR for @p subject and sign it with @p key
 */
UniqueReq createSigningRequest(const SubjectFields& subject, EVP_PKEY* key,
                               const std::string& digest);

/**
 * @brief Add an X.509v3 extension in OpenSSL config syntax
 *
 * @param cert Certificate being built
 * @param issuer Issuer certificate, used for authorityKeyIdentifier style values
 * @param nid Extension NID (NID_basic_constraints, NID_key_usage, ...)
 * @param value e.g. "critical,CA:TRUE, pathlen:0"
 */
void addExtension(X509* cert, X509* issuer, int nid, const std::string& value);

void setSerialNumber(X509* cert, int64_t serial);

/// Copy @p issuerName into the certificate's issuer field
void setIssuerName(X509* cert, X509_NAME* issuerName);

void setSubjectName(X509* cert, X509_NAME* subjectName);

void setPublicKey(X509* cert, EVP_PKEY* key);

/**
 * @brief Sign a certificate
 * @throws CryptoError if the digest is unknown or signing fails
 */
void signCertificate(X509* cert, EVP_PKEY* key, const std::string& digest);

/// Random serial in [1, 2^24)
int64_t randomSerial24();

} // namespace certmgr::pki
