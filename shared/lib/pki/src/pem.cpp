/**
 * @file pem.cpp
 * @brief PEM encode/decode over OpenSSL memory BIOs
 */

#include "certmgr/pki/pem.h"

#include <cstring>
#include <openssl/err.h>
#include <openssl/pem.h>

namespace certmgr::pki {

namespace {

UniqueBio memoryBio(const std::string& text) {
    return UniqueBio(BIO_new_mem_buf(text.data(), static_cast<int>(text.size())));
}

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) return "";
    return std::string(data, static_cast<size_t>(len));
}

/// Passphrase callback; an empty passphrase aborts instead of prompting
int passphraseCallback(char* buf, int size, int /*rwflag*/, void* userdata) {
    const auto* passphrase = static_cast<const std::string*>(userdata);
    if (!passphrase || passphrase->empty()) return -1;
    int len = static_cast<int>(passphrase->size());
    if (len > size) len = size;
    std::memcpy(buf, passphrase->data(), static_cast<size_t>(len));
    return len;
}

bool looksEncrypted(const std::string& pem) {
    return pem.find("ENCRYPTED") != std::string::npos;
}

} // anonymous namespace

// --- PEM Blocks ---

std::vector<std::string> splitPemBlocks(const std::string& text) {
    static const std::string kBegin = "-----BEGIN";
    static const std::string kEnd = "-----END";
    static const std::string kDashes = "-----";

    std::vector<std::string> blocks;
    size_t pos = 0;
    while ((pos = text.find(kBegin, pos)) != std::string::npos) {
        // Label line: "-----BEGIN <label>-----"
        size_t labelEnd = text.find(kDashes, pos + kBegin.size());
        if (labelEnd == std::string::npos) break;
        size_t bodyStart = labelEnd + kDashes.size();

        size_t endMarker = text.find(kEnd, bodyStart);
        if (endMarker == std::string::npos) break;

        // Body must not contain dashes; a nested BEGIN restarts the scan there
        size_t dash = text.find('-', bodyStart);
        if (dash < endMarker) {
            pos = dash;
            continue;
        }

        size_t endLabelEnd = text.find(kDashes, endMarker + kEnd.size());
        if (endLabelEnd == std::string::npos) break;
        size_t blockEnd = endLabelEnd + kDashes.size();

        blocks.push_back(text.substr(pos, blockEnd - pos));
        pos = blockEnd;
    }
    return blocks;
}

// --- Loading ---

UniqueCert loadCertificate(const std::string& pem) {
    if (pem.empty()) return nullptr;
    UniqueBio bio = memoryBio(pem);
    if (!bio) return nullptr;

    X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!cert) ERR_clear_error();
    return UniqueCert(cert);
}

UniqueReq loadCertificateRequest(const std::string& pem) {
    if (pem.empty()) return nullptr;
    UniqueBio bio = memoryBio(pem);
    if (!bio) return nullptr;

    X509_REQ* req = PEM_read_bio_X509_REQ(bio.get(), nullptr, nullptr, nullptr);
    if (!req) ERR_clear_error();
    return UniqueReq(req);
}

KeyLoadResult loadPrivateKey(const std::string& pem, const std::string& passphrase) {
    KeyLoadResult result;
    if (pem.empty()) {
        result.error = KeyLoadError::Malformed;
        return result;
    }

    UniqueBio bio = memoryBio(pem);
    if (bio) {
        result.key.reset(PEM_read_bio_PrivateKey(
            bio.get(), nullptr, passphraseCallback, const_cast<std::string*>(&passphrase)));
    }

    if (!result.key) {
        ERR_clear_error();
        result.error = looksEncrypted(pem) ? KeyLoadError::BadPassphrase : KeyLoadError::Malformed;
    }
    return result;
}

// --- Dumping ---

std::string dumpCertificate(X509* cert) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!cert || !bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        ERR_clear_error();
        throw CryptoError("Failed to encode certificate as PEM");
    }
    return bioToString(bio.get());
}

std::string dumpCertificateRequest(X509_REQ* req) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!req || !bio || PEM_write_bio_X509_REQ(bio.get(), req) != 1) {
        ERR_clear_error();
        throw CryptoError("Failed to encode certificate signing request as PEM");
    }
    return bioToString(bio.get());
}

std::string dumpPrivateKey(EVP_PKEY* key, const std::string& passphrase) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!key || !bio) {
        throw CryptoError("Failed to encode private key as PEM");
    }

    int rc;
    if (passphrase.empty()) {
        rc = PEM_write_bio_PKCS8PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr);
    } else {
        rc = PEM_write_bio_PKCS8PrivateKey(
            bio.get(), key, EVP_aes_256_cbc(),
            nullptr, 0, passphraseCallback, const_cast<std::string*>(&passphrase));
    }

    if (rc != 1) {
        ERR_clear_error();
        throw CryptoError("Failed to encode private key as PEM");
    }
    return bioToString(bio.get());
}

std::vector<unsigned char> certificateToDer(X509* cert) {
    int len = cert ? i2d_X509(cert, nullptr) : -1;
    if (len <= 0) {
        throw CryptoError("Failed to encode certificate as DER");
    }
    std::vector<unsigned char> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    i2d_X509(cert, &p);
    return der;
}

std::vector<unsigned char> certificateRequestToDer(X509_REQ* req) {
    int len = req ? i2d_X509_REQ(req, nullptr) : -1;
    if (len <= 0) {
        throw CryptoError("Failed to encode certificate signing request as DER");
    }
    std::vector<unsigned char> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    i2d_X509_REQ(req, &p);
    return der;
}

} // namespace certmgr::pki
