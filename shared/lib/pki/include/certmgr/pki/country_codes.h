/**
 * @file country_codes.h
 * @brief ISO 3166-1 alpha-2 country code lookup
 */

#pragma once

#include <string>

namespace certmgr::pki {

/// True if @p code is an assigned ISO 3166-1 alpha-2 code (upper case)
bool isValidCountryCode(const std::string& code);

} // namespace certmgr::pki
