/**
 * @file bootstrap_certificate.cpp
 */

#include "bootstrap_certificate.h"
#include "record_material.h"

#include <certmgr/pki/cert_builder.h>
#include <certmgr/pki/pem.h>

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace services {

namespace pki = certmgr::pki;
namespace cert_type = domain::models::cert_type;

namespace {

constexpr int kKeyLength = 2048;
constexpr int kLifetimeDays = 3600;
constexpr const char* kDigest = "SHA256";

} // anonymous namespace

BootstrapCertificate::BootstrapCertificate(repositories::ICertificateRepository* certificates,
                                           repositories::ISystemSettingsRepository* settings,
                                           infrastructure::IServiceRestartHook* restartHook,
                                           std::string defaultName)
    : certificates_(certificates), settings_(settings), restartHook_(restartHook),
      defaultName_(std::move(defaultName))
{
    if (!certificates_ || !settings_ || !restartHook_) {
        throw std::invalid_argument("BootstrapCertificate: collaborators cannot be nullptr");
    }
}

std::optional<int64_t> BootstrapCertificate::ensure() {
    try {
        auto current = settings_->getUiCertificateId();
        if (current && certificates_->findById(*current)) {
            spdlog::debug("[Bootstrap] Serving certificate {} present", *current);
            return current;
        }

        int64_t id = 0;
        if (auto existing = certificates_->findByName(defaultName_)) {
            spdlog::info("[Bootstrap] Reusing certificate '{}' (id={})", defaultName_, existing->id);
            id = existing->id;
        } else {
            id = createDefault();
            spdlog::info("[Bootstrap] Created self-signed certificate '{}' (id={})", defaultName_, id);
        }

        restartHook_->restart("bootstrap certificate");
        settings_->setUiCertificateId(id);
        return id;
    } catch (const std::exception& e) {
        spdlog::error("[Bootstrap] Failed to provision serving certificate: {}", e.what());
        return std::nullopt;
    }
}

int64_t BootstrapCertificate::createDefault() {
    pki::SubjectFields subject;
    subject.country = "US";
    subject.organization = "certmgr";
    subject.commonName = "localhost";
    subject.email = "info@localhost";

    pki::UniqueKey key = pki::generateRsaKey(kKeyLength);
    pki::UniqueCert cert = pki::createCertificate(subject, key.get(), kLifetimeDays);
    pki::setSerialNumber(cert.get(), 1);
    pki::signCertificate(cert.get(), key.get(), kDigest);

    domain::models::CertificateRecord record;
    record.name = defaultName_;
    record.type = cert_type::CERT_EXISTING;
    record.certificate = pki::dumpCertificate(cert.get());
    record.privatekey = pki::dumpPrivateKey(key.get());
    record.chain = false;
    record.keyLength = kKeyLength;
    record.lifetime = kLifetimeDays;
    applyCertificateInfo(record, *record.certificate);

    return certificates_->insert(record);
}

} // namespace services
