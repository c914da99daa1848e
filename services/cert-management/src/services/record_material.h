#pragma once

#include "../domain/models/certificate_record.h"
#include "../domain/models/create_request.h"

#include <certmgr/pki/types.h>

#include <string>

/**
 * @file record_material.h
 * @brief Helpers filling record fields from requests and decoded PEM
 */

namespace services {

certmgr::pki::SubjectFields toSubjectFields(const domain::models::SubjectRequest& subject);

/// Copy subject attributes; SAN is stored space-joined
void applySubject(domain::models::CertificateRecord& record, const certmgr::pki::SubjectFields& subject);

/**
 * @brief Subject, SAN, serial and digest decoded from the first certificate of @p pem
 * @throws certmgr::pki::CryptoError if the certificate does not decode
 */
void applyCertificateInfo(domain::models::CertificateRecord& record, const std::string& pem);

/// True if @p pem holds more than one PEM block
bool hasChain(const std::string& pem);

/**
 * @brief Decrypt a private key and re-export it unencrypted
 * @throws certmgr::pki::CryptoError if the key does not load with @p passphrase
 */
std::string exportKeyWithoutPassphrase(const std::string& pem, const std::string& passphrase);

} // namespace services
