/**
 * @file cert_ops.h
 * @brief Read-only X.509 operations: subject, validity, fingerprint, matching
 *
 * All functions are side-effect free and accept nullptr, returning an
 * empty value for it.
 *
 * @date 2026-02-18
 */

#pragma once

#include "certmgr/pki/types.h"

#include <optional>
#include <string>
#include <openssl/asn1.h>
#include <openssl/x509.h>

namespace certmgr::pki {

/// @name Subject
/// @{

/**
 * @brief Subject DN in OpenSSL oneline format ("/C=US/O=iX/CN=host")
 */
std::string getSubjectDn(X509* cert);

std::string getRequestSubjectDn(X509_REQ* req);

/// Subject attributes plus subjectAltName values of a certificate
SubjectFields getSubjectFields(X509* cert);

/// Subject attributes plus requested subjectAltName values of a CSR
SubjectFields getRequestSubjectFields(X509_REQ* req);

/// @}

/// @name Decoding
/// @{

/**
 * @brief Subject, serial and digest algorithm of a certificate
 *
 * The digest is derived from the signature algorithm's long name,
 * e.g. "sha256WithRSAEncryption" -> "SHA256".
 */
CertificateInfo getCertificateInfo(X509* cert);

/**
 * @brief Serial number, or std::nullopt when negative or wider than 63 bits
 */
std::optional<int64_t> getSerialNumber(X509* cert);

std::optional<std::string> getDigestAlgorithm(X509* cert);

/// @}

/// @name Validity
/// @{

/**
 * @brief Format an ASN.1 time like C ctime() in UTC, e.g. "Mon Jan  5 10:00:00 2026"
 * @return nullopt if the time is missing or does not convert
 */
std::optional<std::string> formatCtime(const ASN1_TIME* t);

std::optional<std::string> getNotBefore(X509* cert);
std::optional<std::string> getNotAfter(X509* cert);

/**
 * @brief Whole days from now until notAfter, rounded toward negative infinity
 *
 * A certificate that expired one second ago reports -1.
 */
std::optional<int> daysUntilExpiry(X509* cert);

/// @}

/// @name Fingerprint
/// @{

/**
 * @brief SHA-1 fingerprint as upper-case colon-separated hex ("AB:CD:...")
 */
std::string getSha1Fingerprint(X509* cert);

/// @}

/// @name Key Matching
/// @{

/// True if @p key is the private half of the certificate's public key
bool keyMatchesCertificate(X509* cert, EVP_PKEY* key);

/// @}

} // namespace certmgr::pki
