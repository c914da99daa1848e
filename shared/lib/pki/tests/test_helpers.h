/**
 * @file test_helpers.h
 * @brief Shared test helpers for certmgr::pki and service unit tests
 *
 * Builds keys, CA and leaf certificates directly with OpenSSL so tests do
 * not depend on the builders they exercise.
 */

#pragma once

#include <string>
#include <memory>
#include <ctime>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/asn1.h>

namespace test_helpers {

/// RAII wrapper for EVP_PKEY
struct PKeyDeleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/// RAII wrapper for X509
struct X509Deleter { void operator()(X509* p) { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

// --- Key Generation ---

inline UniqueKey generateRsaKey(int bits = 2048) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_keygen_init(ctx);
    EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits);
    EVP_PKEY_keygen(ctx, &pkey);
    EVP_PKEY_CTX_free(ctx);
    return UniqueKey(pkey);
}

// --- Certificate Creation ---

inline void addName(X509_NAME* name, const char* field, const std::string& value) {
    X509_NAME_add_entry_by_txt(name, field, MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0);
}

/**
 * @brief Create a self-signed root CA certificate
 */
inline UniqueCert createRootCa(
    EVP_PKEY* key,
    const std::string& cn,
    long serial = 1,
    int validDays = 3650)
{
    X509* cert = X509_new();
    X509_set_version(cert, 2);  // v3
    ASN1_INTEGER_set(X509_get_serialNumber(cert), serial);

    // Subject = Issuer (self-signed)
    X509_NAME* name = X509_NAME_new();
    addName(name, "C", "US");
    addName(name, "O", "Test CA");
    addName(name, "CN", cn);
    X509_set_subject_name(cert, name);
    X509_set_issuer_name(cert, name);
    X509_NAME_free(name);

    ASN1_TIME_set(X509_getm_notBefore(cert), time(nullptr) - 86400);
    ASN1_TIME_set(X509_getm_notAfter(cert), time(nullptr) + validDays * 86400L);

    X509_set_pubkey(cert, key);

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_basic_constraints, const_cast<char*>("critical,CA:TRUE"));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);

    ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_key_usage, const_cast<char*>("critical,keyCertSign,cRLSign"));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);

    X509_sign(cert, key, EVP_sha256());
    return UniqueCert(cert);
}

/**
 * @brief Create a leaf certificate signed by issuer, with optional DNS SAN
 */
inline UniqueCert createLeaf(
    EVP_PKEY* leafKey,
    EVP_PKEY* issuerKey,
    X509* issuerCert,
    const std::string& cn,
    long serial = 100,
    int validDays = 365,
    const std::string& san = "")
{
    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), serial);

    X509_NAME* subject = X509_NAME_new();
    addName(subject, "C", "US");
    addName(subject, "ST", "Tennessee");
    addName(subject, "L", "Maryville");
    addName(subject, "O", "Example");
    addName(subject, "CN", cn);
    addName(subject, "emailAddress", "admin@example.com");
    X509_set_subject_name(cert, subject);
    X509_NAME_free(subject);

    X509_set_issuer_name(cert, X509_get_subject_name(issuerCert));

    ASN1_TIME_set(X509_getm_notBefore(cert), time(nullptr) - 86400);
    ASN1_TIME_set(X509_getm_notAfter(cert), time(nullptr) + validDays * 86400L);

    X509_set_pubkey(cert, leafKey);

    if (!san.empty()) {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, issuerCert, cert, nullptr, nullptr, 0);
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, const_cast<char*>(san.c_str()));
        X509_add_ext(cert, ext, -1);
        X509_EXTENSION_free(ext);
    }

    X509_sign(cert, issuerKey, EVP_sha256());
    return UniqueCert(cert);
}

// --- PEM ---

inline std::string toPem(X509* cert) {
    BIO* bio = BIO_new(BIO_s_mem());
    PEM_write_bio_X509(bio, cert);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));
    BIO_free(bio);
    return pem;
}

inline std::string toPem(EVP_PKEY* key) {
    BIO* bio = BIO_new(BIO_s_mem());
    PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));
    BIO_free(bio);
    return pem;
}

} // namespace test_helpers
