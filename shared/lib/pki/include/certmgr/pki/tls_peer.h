/**
 * @file tls_peer.h
 * @brief Fetch the certificate a TLS server presents
 */

#pragma once

#include "types.h"

#include <string>

namespace certmgr::pki {

/**
 * @brief Connect to @p host:@p port and return the server's leaf certificate
 *
 * The chain is not verified; this reads whatever the server presents.
 *
 * @return nullptr if the host does not resolve or the TCP connection fails
 * @throws CryptoError if the TLS handshake fails or no certificate is sent
 */
UniqueCert fetchPeerCertificate(const std::string& host, int port);

} // namespace certmgr::pki
