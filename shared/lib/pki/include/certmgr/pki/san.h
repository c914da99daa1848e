/**
 * @file san.h
 * @brief subjectAltName helpers
 */

#pragma once

#include <string>
#include <vector>

namespace certmgr::pki {

/// True for a literal IPv4 or IPv6 address
bool isIpAddress(const std::string& value);

/**
 * @brief Render SAN values as an OpenSSL extension value
 *
 * {"example.com", "10.0.0.1"} -> "DNS: example.com, IP: 10.0.0.1".
 * Returns an empty string for an empty list.
 */
std::string sanToString(const std::vector<std::string>& san);

/// Split a stored, whitespace-separated SAN string into its values
std::vector<std::string> splitSan(const std::string& stored);

/// Inverse of splitSan(): single spaces between values
std::string joinSan(const std::vector<std::string>& san);

} // namespace certmgr::pki
