/**
 * @file certificate_service.cpp
 * @brief CertificateService implementation
 */

#include "certificate_service.h"
#include "record_material.h"

#include <certmgr/pki/cert_builder.h>
#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/pem.h>
#include <certmgr/pki/tls_peer.h>

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <spdlog/spdlog.h>
#include <openssl/x509v3.h>

namespace services {

using domain::models::CertificateRecord;
using domain::models::CertificateView;
using domain::models::Store;
using infrastructure::OperationCategory;
namespace cert_type = domain::models::cert_type;
namespace models = domain::models;
namespace pki = certmgr::pki;

namespace {

constexpr const char* kCreateSchema = "certificate_create";

} // anonymous namespace

CertificateService::CertificateService(repositories::ICertificateRepository* certificates,
                                       repositories::ICertificateRepository* authorities,
                                       repositories::ISystemSettingsRepository* settings,
                                       AcmeIssuanceService* acme,
                                       EntityExtender* extender,
                                       SerialAllocator* serials,
                                       AttributeValidator* validator,
                                       infrastructure::OperationLocks* locks,
                                       infrastructure::IServiceRestartHook* restartHook)
    : certificates_(certificates), authorities_(authorities), settings_(settings), acme_(acme),
      extender_(extender), serials_(serials), validator_(validator), locks_(locks),
      restartHook_(restartHook)
{
    if (!certificates_ || !authorities_ || !settings_ || !acme_ || !extender_ || !serials_ ||
        !validator_ || !locks_ || !restartHook_) {
        throw std::invalid_argument("CertificateService: collaborators cannot be nullptr");
    }
}

// =============================================================================
// Create
// =============================================================================

CertificateView CertificateService::create(const models::CertificateCreateRequest& request,
                                           common::ProgressReporter& progress) {
    auto guard = locks_->acquire(OperationCategory::CertificateCreate);

    const std::string& name = models::requestName(request);

    common::ValidationErrors errors;
    validator_->validateCommonAttributes(kCreateSchema, models::commonAttributes(request), errors);
    validator_->validateName(kCreateSchema, name, errors);
    errors.throwIfAny();

    progress.set(10, "Initial validation complete");

    // Owned only while a serial is allocated and not yet stored
    infrastructure::OperationGuard serialGuard;

    CertificateRecord record = std::visit([this, &progress, &serialGuard](const auto& r) -> CertificateRecord {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, models::CreateInternalCertificate>) {
            return createInternal(r, progress, serialGuard);
        } else if constexpr (std::is_same_v<T, models::ImportCertificate>) {
            return importCertificate(r, progress);
        } else if constexpr (std::is_same_v<T, models::CreateCsr>) {
            return createCsr(r, progress);
        } else if constexpr (std::is_same_v<T, models::ImportCsr>) {
            return importCsr(r, progress);
        } else if constexpr (std::is_same_v<T, models::CreateAcmeCertificate>) {
            return createAcme(r, progress);
        } else if constexpr (std::is_same_v<T, models::CreateFromSignedCertificate>) {
            return createFromSigned(r, progress);
        } else {
            static_assert(std::is_void_v<T>, "unhandled certificate request variant");
        }
    }, request);

    record.name = name;
    return store(std::move(record), serialGuard, progress);
}

CertificateView CertificateService::createSigned(models::CreateFromSignedCertificate request,
                                                 const SignWithSerial& sign,
                                                 common::ProgressReporter& progress) {
    if (!request.signedby) {
        throw std::invalid_argument("CertificateService::createSigned: signedby is required");
    }

    auto guard = locks_->acquire(OperationCategory::CertificateCreate);

    common::ValidationErrors errors;
    validator_->validateName(kCreateSchema, request.name, errors);
    errors.throwIfAny();

    progress.set(10, "Initial validation complete");

    infrastructure::OperationGuard serialGuard = locks_->acquire(OperationCategory::SerialAllocation);
    int64_t serial = serials_->next(*request.signedby);
    request.certificate = sign(serial);

    CertificateRecord record = createFromSigned(request, progress);
    record.name = request.name;
    record.serial = serial;
    return store(std::move(record), serialGuard, progress);
}

CertificateView CertificateService::store(CertificateRecord record, infrastructure::OperationGuard& serialGuard,
                                          common::ProgressReporter& progress) {
    record.id = certificates_->insert(record);
    serialGuard.unlock();

    restartHook_->restart("certificate " + record.name + " created");

    progress.set(100, "Certificate created successfully");
    spdlog::info("[CertificateService] Certificate created: id={}, name={}, type={:#x}",
                 record.id, record.name, record.type);

    return extender_->extend(requireRecord(record.id, kCreateSchema), Store::Certificate);
}

CertificateRecord CertificateService::createInternal(const models::CreateInternalCertificate& r,
                                                     common::ProgressReporter& progress,
                                                     infrastructure::OperationGuard& serialGuard) {
    auto ca = authorities_->findById(r.signedby);
    if (!ca || !ca->hasCertificate() || !ca->hasPrivateKey()) {
        throw common::PreconditionException("certificate_create.signedby",
                                            "Please provide a valid signing authority");
    }

    pki::UniqueCert caCert = pki::loadCertificate(*ca->certificate);
    pki::KeyLoadResult caKey = pki::loadPrivateKey(*ca->privatekey);
    if (!caCert || !caKey.ok()) {
        throw common::PreconditionException("certificate_create.signedby",
                                            "Please provide a valid signing authority");
    }

    pki::SubjectFields subject = toSubjectFields(r.subject);
    pki::UniqueKey key = pki::generateRsaKey(r.keyLength);

    pki::UniqueCert cert = pki::createCertificate(subject, key.get(), r.lifetime);
    pki::setIssuerName(cert.get(), X509_get_subject_name(caCert.get()));
    pki::addExtension(cert.get(), nullptr, NID_subject_key_identifier, "hash");

    progress.set(75);

    // Held by create() until the record is stored
    serialGuard = locks_->acquire(OperationCategory::SerialAllocation);
    int64_t serial = serials_->next(r.signedby);
    pki::setSerialNumber(cert.get(), serial);
    pki::signCertificate(cert.get(), caKey.key.get(), r.digestAlgorithm);

    CertificateRecord record;
    record.type = cert_type::CERT_INTERNAL;
    applySubject(record, subject);
    record.certificate = pki::dumpCertificate(cert.get());
    record.privatekey = pki::dumpPrivateKey(key.get());
    record.serial = serial;
    record.signedby = r.signedby;
    record.keyLength = r.keyLength;
    record.digestAlgorithm = r.digestAlgorithm;
    record.lifetime = r.lifetime;

    progress.set(90, "Finalizing changes");
    return record;
}

CertificateRecord CertificateService::importCertificate(const models::ImportCertificate& r,
                                                        common::ProgressReporter& progress) {
    std::optional<std::string> privatekey = r.privatekey;
    std::optional<std::string> passphrase = r.passphrase;

    if (r.csrId && *r.csrId != 0) {
        auto csrRecord = certificates_->findById(*r.csrId);
        if (!csrRecord || !csrRecord->hasCsr()) {
            throw common::PreconditionException("certificate_create.csr_id",
                                                "Please provide a valid csr_id which has a valid CSR filed");
        }
        privatekey = csrRecord->privatekey;
        passphrase.reset();
    } else if (!privatekey || privatekey->empty()) {
        throw common::ValidationException("certificate_create.privatekey",
                                          "Private key is required when importing a certificate");
    }

    progress.set(50, "Validation complete");

    CertificateRecord record;
    record.type = cert_type::CERT_EXISTING;
    record.certificate = r.certificate;
    applyCertificateInfo(record, r.certificate);
    record.chain = hasChain(r.certificate);
    record.privatekey = privatekey;
    if (passphrase && !passphrase->empty() && privatekey) {
        record.privatekey = exportKeyWithoutPassphrase(*privatekey, *passphrase);
    }

    progress.set(90, "Finalizing changes");
    return record;
}

CertificateRecord CertificateService::createCsr(const models::CreateCsr& r,
                                                common::ProgressReporter& progress) {
    pki::SubjectFields subject = toSubjectFields(r.subject);
    pki::UniqueKey key = pki::generateRsaKey(r.keyLength);
    pki::UniqueReq req = pki::createSigningRequest(subject, key.get(), r.digestAlgorithm);

    progress.set(80);

    CertificateRecord record;
    record.type = cert_type::CERT_CSR;
    applySubject(record, subject);
    record.csr = pki::dumpCertificateRequest(req.get());
    record.privatekey = pki::dumpPrivateKey(key.get());
    record.keyLength = r.keyLength;
    record.digestAlgorithm = r.digestAlgorithm;

    progress.set(90, "Finalizing changes");
    return record;
}

CertificateRecord CertificateService::importCsr(const models::ImportCsr& r,
                                                common::ProgressReporter& progress) {
    pki::UniqueReq req = pki::loadCertificateRequest(r.csr);
    if (!req) {
        throw common::ValidationException("certificate_create.CSR", "Please provide a valid CSR");
    }

    CertificateRecord record;
    record.type = cert_type::CERT_CSR;
    record.csr = r.csr;
    applySubject(record, pki::getRequestSubjectFields(req.get()));

    progress.set(80);

    record.privatekey = r.privatekey;
    if (r.passphrase && !r.passphrase->empty()) {
        record.privatekey = exportKeyWithoutPassphrase(r.privatekey, *r.passphrase);
    }

    progress.set(90, "Finalizing changes");
    return record;
}

CertificateRecord CertificateService::createAcme(const models::CreateAcmeCertificate& r,
                                                 common::ProgressReporter& progress) {
    auto csrRecord = certificates_->findById(r.csrId);
    if (!csrRecord || !csrRecord->hasCsr()) {
        throw common::PreconditionException("certificate_create.csr_id",
                                            "Please provide a valid csr_id which has a valid CSR filed");
    }

    IssuanceRequest issuance;
    issuance.directoryUri = r.acmeDirectoryUri;
    if (issuance.directoryUri.empty() || issuance.directoryUri.back() != '/') {
        issuance.directoryUri += '/';
    }
    issuance.dnsMapping = r.dnsMapping;
    issuance.tos = r.tos;

    models::FinalOrder finalOrder = acme_->issueCertificate(*csrRecord, issuance, progress, 25);

    progress.set(95, "Final order received from ACME server");

    CertificateRecord record;
    record.type = cert_type::CERT_EXISTING;
    record.certificate = finalOrder.fullchainPem;
    applyCertificateInfo(record, finalOrder.fullchainPem);
    record.chain = hasChain(finalOrder.fullchainPem);
    record.csr = csrRecord->csr;
    record.privatekey = csrRecord->privatekey;
    record.acme = finalOrder.registrationId;
    record.acmeUri = finalOrder.uri;
    record.domainsAuthenticators = r.dnsMapping;
    record.renewDays = r.renewDays;
    return record;
}

CertificateRecord CertificateService::createFromSigned(const models::CreateFromSignedCertificate& r,
                                                       common::ProgressReporter& progress) {
    CertificateRecord record;
    record.type = r.type;
    record.certificate = r.certificate;
    if (r.privatekey && !r.privatekey->empty()) {
        record.privatekey = r.privatekey;
    }
    record.signedby = r.signedby;
    applyCertificateInfo(record, r.certificate);

    progress.set(90, "Finalizing changes");
    return record;
}

// =============================================================================
// Update / Delete
// =============================================================================

CertificateRecord CertificateService::requireRecord(int64_t id, const std::string& field) {
    auto record = certificates_->findById(id);
    if (!record) {
        throw common::PreconditionException(field + ".id", "Certificate " + std::to_string(id) +
                                                                " does not exist");
    }
    return *record;
}

CertificateView CertificateService::update(int64_t id, const std::optional<std::string>& name,
                                           common::ProgressReporter& progress) {
    auto guard = locks_->acquire(OperationCategory::CertificateUpdate);

    CertificateRecord record = requireRecord(id, "certificate_update");

    if (name && *name != record.name) {
        common::ValidationErrors errors;
        validator_->validateName("certificate_update", *name, errors);
        errors.throwIfAny();

        spdlog::info("[CertificateService] Renaming certificate {}: {} -> {}", id, record.name, *name);
        record.name = *name;
        certificates_->update(record);
        restartHook_->restart("certificate " + record.name + " renamed");
    }

    progress.set(90, "Finalizing changes");
    return extender_->extend(record, Store::Certificate);
}

void CertificateService::remove(int64_t id, bool force, common::ProgressReporter& progress) {
    auto guard = locks_->acquire(OperationCategory::CertificateDelete);

    auto uiCertificate = settings_->getUiCertificateId();
    if (uiCertificate && *uiCertificate == id) {
        throw common::PolicyException(
            "certificate_delete.id",
            "Selected certificate is being used by system HTTPS server, please select another one");
    }

    CertificateRecord record = requireRecord(id, "certificate_delete");

    if (record.isAcme()) {
        try {
            acme_->revokeCertificate(record);
        } catch (const std::exception& e) {
            if (!force) {
                throw common::ProtocolException(std::string("Failed to revoke certificate: ") + e.what());
            }
            spdlog::warn("[CertificateService] Revocation of {} failed, deleting anyway: {}",
                         record.name, e.what());
        }
    }

    certificates_->remove(id);
    restartHook_->restart("certificate " + record.name + " deleted");

    spdlog::info("[CertificateService] Certificate deleted: id={}, name={}", id, record.name);
    progress.set(100);
}

// =============================================================================
// Queries
// =============================================================================

std::vector<CertificateView> CertificateService::list() {
    return extender_->extendAll(certificates_->findAll(), Store::Certificate);
}

std::optional<CertificateView> CertificateService::get(int64_t id) {
    auto record = certificates_->findById(id);
    if (!record) return std::nullopt;
    return extender_->extend(*record, Store::Certificate);
}

std::optional<std::string> CertificateService::fingerprint(int64_t id) {
    auto record = certificates_->findById(id);
    if (!record || !record->hasCertificate()) return std::nullopt;

    pki::UniqueCert cert = pki::loadCertificate(*record->certificate);
    if (!cert) return std::nullopt;
    return pki::getSha1Fingerprint(cert.get());
}

std::optional<std::string> CertificateService::hostCertificateFingerprint(const std::string& hostname, int port) {
    common::ValidationErrors errors;
    if (hostname.empty()) {
        errors.add("certificate_host_fingerprint.hostname", "This field is required");
    }
    if (port < 1 || port > 65535) {
        errors.add("certificate_host_fingerprint.port", "Should be between 1 and 65535");
    }
    errors.throwIfAny();

    pki::UniqueCert cert = pki::fetchPeerCertificate(hostname, port);
    if (!cert) {
        spdlog::warn("[CertificateService] Could not connect to {}:{}", hostname, port);
        return std::nullopt;
    }
    return pki::getSha1Fingerprint(cert.get());
}

std::vector<std::string> CertificateService::domainNames(int64_t id) {
    return certificateDomainNames(requireRecord(id, "certificate"));
}

void CertificateService::removeDomainsAuthenticator(int64_t authenticatorId) {
    auto guard = locks_->acquire(OperationCategory::CertificateUpdate);

    for (auto& cert : certificates_->findAcmeIssued()) {
        bool changed = false;
        for (auto it = cert.domainsAuthenticators.begin(); it != cert.domainsAuthenticators.end();) {
            if (it->second == authenticatorId) {
                it = cert.domainsAuthenticators.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
        if (changed) {
            certificates_->update(cert);
            spdlog::info("[CertificateService] Removed DNS authenticator {} from {}", authenticatorId, cert.name);
        }
    }
}

std::map<std::string, std::string> CertificateService::acmeServerChoices() {
    return {
        {"https://acme-staging-v02.api.letsencrypt.org/directory", "Let's Encrypt Staging Directory"},
        {"https://acme-v02.api.letsencrypt.org/directory", "Let's Encrypt Production Directory"},
    };
}

} // namespace services
