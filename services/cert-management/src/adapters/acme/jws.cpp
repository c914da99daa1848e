/**
 * @file jws.cpp
 * @brief JwsSigner implementation
 */

#include "jws.h"
#include "exceptions.h"

#include <certmgr/pki/encoding.h>
#include <certmgr/pki/pem.h>

#include <vector>
#include <json/json.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>

namespace adapters {

namespace pki = certmgr::pki;

namespace {

struct BnDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
struct MdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };

std::string encodeBignum(EVP_PKEY* key, const char* param) {
    BIGNUM* raw = nullptr;
    if (EVP_PKEY_get_bn_param(key, param, &raw) != 1 || !raw) {
        throw common::ProtocolException(std::string("ACME account key lacks RSA parameter ") + param);
    }
    std::unique_ptr<BIGNUM, BnDeleter> bn(raw);
    std::vector<unsigned char> bytes(static_cast<size_t>(BN_num_bytes(bn.get())));
    BN_bn2bin(bn.get(), bytes.data());
    return pki::base64UrlEncode(bytes);
}

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // anonymous namespace

JwsSigner::JwsSigner(const std::string& accountKeyPem) {
    pki::KeyLoadResult loaded = pki::loadPrivateKey(accountKeyPem);
    if (!loaded.ok()) {
        throw common::ProtocolException("Unable to load ACME account key");
    }
    if (EVP_PKEY_get_base_id(loaded.key.get()) != EVP_PKEY_RSA) {
        throw common::ProtocolException("ACME account key must be RSA");
    }
    key_ = std::move(loaded.key);

    // Thumbprint input must be exactly this member order with no whitespace
    jwk_ = "{\"e\":\"" + encodeBignum(key_.get(), OSSL_PKEY_PARAM_RSA_E) +
           "\",\"kty\":\"RSA\",\"n\":\"" + encodeBignum(key_.get(), OSSL_PKEY_PARAM_RSA_N) + "\"}";

    try {
        thumbprint_ = pki::base64UrlEncode(pki::sha256(jwk_));
    } catch (const pki::CryptoError& e) {
        throw common::ProtocolException(std::string("JWK thumbprint failed: ") + e.what());
    }
}

std::string JwsSigner::dnsTxtValue(const std::string& token) const {
    try {
        return pki::base64UrlEncode(pki::sha256(token + "." + thumbprint_));
    } catch (const pki::CryptoError& e) {
        throw common::ProtocolException(std::string("Key authorization digest failed: ") + e.what());
    }
}

std::string JwsSigner::sign(const std::string& url, const std::string& nonce,
                            const std::string& payload, const std::optional<std::string>& kid) const {
    Json::Value protectedHeader(Json::objectValue);
    protectedHeader["alg"] = "RS256";
    protectedHeader["nonce"] = nonce;
    protectedHeader["url"] = url;
    if (kid) {
        protectedHeader["kid"] = *kid;
    } else {
        Json::Value jwk;
        Json::CharReaderBuilder reader;
        std::string errs;
        std::unique_ptr<Json::CharReader> parser(reader.newCharReader());
        if (!parser->parse(jwk_.data(), jwk_.data() + jwk_.size(), &jwk, &errs)) {
            throw common::ProtocolException("JWK encoding failed: " + errs);
        }
        protectedHeader["jwk"] = jwk;
    }

    std::string encodedHeader = pki::base64UrlEncode(compactJson(protectedHeader));
    std::string encodedPayload = payload.empty() ? std::string() : pki::base64UrlEncode(payload);

    Json::Value body(Json::objectValue);
    body["protected"] = encodedHeader;
    body["payload"] = encodedPayload;
    body["signature"] = signature(encodedHeader + "." + encodedPayload);
    return compactJson(body);
}

std::string JwsSigner::signature(const std::string& input) const {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    size_t length = 0;
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1 ||
        EVP_DigestSignUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestSignFinal(ctx.get(), nullptr, &length) != 1) {
        throw common::ProtocolException("RS256 signing failed");
    }

    std::vector<unsigned char> sig(length);
    if (EVP_DigestSignFinal(ctx.get(), sig.data(), &length) != 1) {
        throw common::ProtocolException("RS256 signing failed");
    }
    sig.resize(length);
    return pki::base64UrlEncode(sig);
}

} // namespace adapters
