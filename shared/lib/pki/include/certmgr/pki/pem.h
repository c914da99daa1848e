/**
 * @file pem.h
 * @brief PEM load/dump for certificates, private keys and signing requests
 *
 * Loaders return nullptr (or a KeyLoadResult with an error) for input that
 * does not decode. Dumpers throw CryptoError when OpenSSL fails to encode.
 *
 * @date 2026-02-18
 */

#pragma once

#include "certmgr/pki/types.h"

#include <string>
#include <vector>

namespace certmgr::pki {

/// @name PEM Blocks
/// @{

/**
 * @brief Split a text blob into its "-----BEGIN ...----- ... -----END ...-----" blocks
 * @return Blocks in document order; empty if none are found
 */
std::vector<std::string> splitPemBlocks(const std::string& text);

/// @}

/// @name Loading
/// @{

/// Decode the first certificate of a PEM blob
UniqueCert loadCertificate(const std::string& pem);

UniqueReq loadCertificateRequest(const std::string& pem);

/**
 * @brief Decode a PEM private key, optionally encrypted
 *
 * Never prompts on a terminal. An encrypted key with a missing or wrong
 * passphrase yields KeyLoadError::BadPassphrase; anything else that fails
 * to decode yields KeyLoadError::Malformed.
 *
 * @param pem PEM text
 * @param passphrase Empty for unencrypted keys
 */
KeyLoadResult loadPrivateKey(const std::string& pem, const std::string& passphrase = "");

/// @}

/// @name Dumping
/// @{

std::string dumpCertificate(X509* cert);

std::string dumpCertificateRequest(X509_REQ* req);

/**
 * @brief Encode a private key as PKCS#8 PEM
 * @param passphrase Non-empty to encrypt with AES-256-CBC
 */
std::string dumpPrivateKey(EVP_PKEY* key, const std::string& passphrase = "");

/// DER bytes of a certificate (ACME revocation, CSR finalization)
std::vector<unsigned char> certificateToDer(X509* cert);

std::vector<unsigned char> certificateRequestToDer(X509_REQ* req);

/// @}

} // namespace certmgr::pki
