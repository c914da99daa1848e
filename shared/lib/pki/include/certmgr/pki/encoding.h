/**
 * @file encoding.h
 * @brief base64url (RFC 4648 section 5, unpadded) and SHA-256 helpers for JOSE
 */

#pragma once

#include <string>
#include <vector>

namespace certmgr::pki {

std::string base64UrlEncode(const unsigned char* data, size_t len);

std::string base64UrlEncode(const std::string& data);

std::string base64UrlEncode(const std::vector<unsigned char>& data);

/// @throws CryptoError if the digest cannot be computed
std::vector<unsigned char> sha256(const std::string& data);

} // namespace certmgr::pki
