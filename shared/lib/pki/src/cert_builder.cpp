/**
 * @file cert_builder.cpp
 * @brief Certificate and CSR construction over the OpenSSL 3 EVP API
 */

#include "certmgr/pki/cert_builder.h"
#include "certmgr/pki/san.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

namespace certmgr::pki {

namespace {

struct PKeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
using UniquePKeyCtx = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

struct NameDeleter { void operator()(X509_NAME* p) const { X509_NAME_free(p); } };
using UniqueName = std::unique_ptr<X509_NAME, NameDeleter>;

std::string lastOpensslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

void addEntry(X509_NAME* name, const char* field, const std::optional<std::string>& value) {
    if (!value || value->empty()) return;
    if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
            reinterpret_cast<const unsigned char*>(value->c_str()), -1, -1, 0) != 1) {
        throw CryptoError(std::string("Invalid subject attribute ") + field + ": " + lastOpensslError());
    }
}

UniqueName buildName(const SubjectFields& subject) {
    UniqueName name(X509_NAME_new());
    if (!name) throw CryptoError("X509_NAME_new failed");

    addEntry(name.get(), "C", subject.country);
    addEntry(name.get(), "ST", subject.state);
    addEntry(name.get(), "L", subject.city);
    addEntry(name.get(), "O", subject.organization);
    addEntry(name.get(), "OU", subject.organizationalUnit);
    addEntry(name.get(), "CN", subject.commonName);
    addEntry(name.get(), "emailAddress", subject.email);
    return name;
}

X509_EXTENSION* makeExtension(X509V3_CTX* ctx, int nid, const std::string& value) {
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, const_cast<char*>(value.c_str()));
    if (!ext) {
        throw CryptoError("Invalid extension value '" + value + "': " + lastOpensslError());
    }
    return ext;
}

} // anonymous namespace

// --- Keys and digests ---

UniqueKey generateRsaKey(int bits) {
    UniquePKeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) != 1) {
        throw CryptoError("RSA key generation setup failed: " + lastOpensslError());
    }

    EVP_PKEY* key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &key) != 1) {
        throw CryptoError("RSA key generation failed: " + lastOpensslError());
    }
    return UniqueKey(key);
}

const EVP_MD* digestByName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const EVP_MD* md = EVP_get_digestbyname(lower.c_str());
    if (!md) {
        ERR_clear_error();
        throw CryptoError("Unsupported digest algorithm: " + name);
    }
    return md;
}

// --- Construction ---

UniqueCert createCertificate(const SubjectFields& subject, EVP_PKEY* publicKey, int lifetimeDays) {
    UniqueCert cert(X509_new());
    if (!cert) throw CryptoError("X509_new failed");

    // Setting it to 2 results in a v3 certificate
    X509_set_version(cert.get(), 2);

    UniqueName name = buildName(subject);
    X509_set_subject_name(cert.get(), name.get());
    X509_set_issuer_name(cert.get(), name.get());

    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(lifetimeDays) * 86400L);

    if (publicKey) {
        setPublicKey(cert.get(), publicKey);
    }

    if (!subject.san.empty()) {
        addExtension(cert.get(), nullptr, NID_subject_alt_name, sanToString(subject.san));
    }
    return cert;
}

UniqueReq createSigningRequest(const SubjectFields& subject, EVP_PKEY* key,
                               const std::string& digest) {
    if (!key) throw CryptoError("Signing request requires a key");

    UniqueReq req(X509_REQ_new());
    if (!req) throw CryptoError("X509_REQ_new failed");

    UniqueName name = buildName(subject);
    X509_REQ_set_subject_name(req.get(), name.get());

    if (!subject.san.empty()) {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, nullptr, nullptr, req.get(), nullptr, 0);

        STACK_OF(X509_EXTENSION)* exts = sk_X509_EXTENSION_new_null();
        sk_X509_EXTENSION_push(exts, makeExtension(&ctx, NID_subject_alt_name, sanToString(subject.san)));
        int rc = X509_REQ_add_extensions(req.get(), exts);
        sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
        if (rc != 1) {
            throw CryptoError("Failed to add CSR extensions: " + lastOpensslError());
        }
    }

    if (X509_REQ_set_pubkey(req.get(), key) != 1) {
        throw CryptoError("Failed to set CSR public key: " + lastOpensslError());
    }
    if (X509_REQ_sign(req.get(), key, digestByName(digest)) <= 0) {
        throw CryptoError("Failed to sign CSR: " + lastOpensslError());
    }
    return req;
}

void addExtension(X509* cert, X509* issuer, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer ? issuer : cert, cert, nullptr, nullptr, 0);

    X509_EXTENSION* ext = makeExtension(&ctx, nid, value);
    int rc = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (rc != 1) {
        throw CryptoError("Failed to add extension: " + lastOpensslError());
    }
}

void setSerialNumber(X509* cert, int64_t serial) {
    if (ASN1_INTEGER_set_int64(X509_get_serialNumber(cert), serial) != 1) {
        throw CryptoError("Failed to set serial number: " + lastOpensslError());
    }
}

void setIssuerName(X509* cert, X509_NAME* issuerName) {
    if (X509_set_issuer_name(cert, issuerName) != 1) {
        throw CryptoError("Failed to set issuer name: " + lastOpensslError());
    }
}

void setSubjectName(X509* cert, X509_NAME* subjectName) {
    if (X509_set_subject_name(cert, subjectName) != 1) {
        throw CryptoError("Failed to set subject name: " + lastOpensslError());
    }
}

void setPublicKey(X509* cert, EVP_PKEY* key) {
    if (X509_set_pubkey(cert, key) != 1) {
        throw CryptoError("Failed to set public key: " + lastOpensslError());
    }
}

void signCertificate(X509* cert, EVP_PKEY* key, const std::string& digest) {
    if (!cert || !key) throw CryptoError("Signing requires a certificate and a key");
    if (X509_sign(cert, key, digestByName(digest)) <= 0) {
        throw CryptoError("Failed to sign certificate: " + lastOpensslError());
    }
}

int64_t randomSerial24() {
    unsigned char bytes[3];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw CryptoError("RAND_bytes failed: " + lastOpensslError());
    }
    int64_t serial = (static_cast<int64_t>(bytes[0]) << 16) |
                     (static_cast<int64_t>(bytes[1]) << 8) |
                     static_cast<int64_t>(bytes[2]);
    return serial == 0 ? 1 : serial;
}

} // namespace certmgr::pki
