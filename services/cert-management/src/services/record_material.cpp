/**
 * @file record_material.cpp
 * @brief Record material helpers
 */

#include "record_material.h"

#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/pem.h>
#include <certmgr/pki/san.h>

namespace services {

namespace pki = certmgr::pki;

pki::SubjectFields toSubjectFields(const domain::models::SubjectRequest& subject) {
    pki::SubjectFields fields;
    fields.country = subject.country;
    fields.state = subject.state;
    fields.city = subject.city;
    fields.organization = subject.organization;
    fields.organizationalUnit = subject.organizationalUnit;
    fields.commonName = subject.common;
    fields.email = subject.email;
    fields.san = subject.san;
    return fields;
}

void applySubject(domain::models::CertificateRecord& record, const pki::SubjectFields& subject) {
    record.country = subject.country;
    record.state = subject.state;
    record.city = subject.city;
    record.organization = subject.organization;
    record.organizationalUnit = subject.organizationalUnit;
    record.common = subject.commonName;
    record.email = subject.email;
    record.san = pki::joinSan(subject.san);
}

void applyCertificateInfo(domain::models::CertificateRecord& record, const std::string& pem) {
    pki::UniqueCert cert = pki::loadCertificate(pem);
    if (!cert) {
        throw pki::CryptoError("Certificate not in PEM format");
    }
    pki::CertificateInfo info = pki::getCertificateInfo(cert.get());
    applySubject(record, info.subject);
    record.serial = info.serial;
    record.digestAlgorithm = info.digestAlgorithm;
}

bool hasChain(const std::string& pem) {
    return pki::splitPemBlocks(pem).size() > 1;
}

std::string exportKeyWithoutPassphrase(const std::string& pem, const std::string& passphrase) {
    pki::KeyLoadResult key = pki::loadPrivateKey(pem, passphrase);
    if (!key.ok()) {
        throw pki::CryptoError("Private key does not load with the given passphrase");
    }
    return pki::dumpPrivateKey(key.key.get());
}

} // namespace services
