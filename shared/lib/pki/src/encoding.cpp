#include "certmgr/pki/encoding.h"
#include "certmgr/pki/types.h"

#include <openssl/evp.h>

namespace certmgr::pki {

std::string base64UrlEncode(const unsigned char* data, size_t len) {
    if (len == 0) return "";

    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminator
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));

    while (!out.empty() && out.back() == '=') out.pop_back();
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::string base64UrlEncode(const std::string& data) {
    return base64UrlEncode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string base64UrlEncode(const std::vector<unsigned char>& data) {
    return base64UrlEncode(data.data(), data.size());
}

std::vector<unsigned char> sha256(const std::string& data) {
    std::vector<unsigned char> md(EVP_MAX_MD_SIZE);
    unsigned int mdLen = 0;
    if (EVP_Digest(data.data(), data.size(), md.data(), &mdLen, EVP_sha256(), nullptr) != 1) {
        throw CryptoError("SHA-256 digest failed");
    }
    md.resize(mdLen);
    return md;
}

} // namespace certmgr::pki
