/**
 * @file certificate_authority_service.cpp
 */

#include "certificate_authority_service.h"
#include "record_material.h"

#include <certmgr/pki/cert_builder.h>
#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/pem.h>

#include <stdexcept>
#include <type_traits>
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

constexpr const char* kCreateSchema = "certificate_authority_create";
constexpr const char* kUpdateSchema = "certificate_authority_update";
constexpr int kSignedCsrLifetimeDays = 3650;
constexpr const char* kSignCsrType = "CA_SIGN_CSR";

void addCaExtensions(X509* cert, X509* issuer, const std::string& basicConstraints) {
    pki::addExtension(cert, issuer, NID_basic_constraints, basicConstraints);
    pki::addExtension(cert, issuer, NID_key_usage, "critical,keyCertSign,cRLSign");
    pki::addExtension(cert, issuer, NID_subject_key_identifier, "hash");
}

} // anonymous namespace

CertificateAuthorityService::CertificateAuthorityService(
    repositories::ICertificateRepository* authorities,
    repositories::ICertificateRepository* certificates,
    CertificateService* certificateService,
    EntityExtender* extender,
    SerialAllocator* serials,
    AttributeValidator* validator,
    infrastructure::OperationLocks* locks,
    infrastructure::IServiceRestartHook* restartHook)
    : authorities_(authorities), certificates_(certificates), certificateService_(certificateService),
      extender_(extender), serials_(serials), validator_(validator), locks_(locks),
      restartHook_(restartHook)
{
    if (!authorities_ || !certificates_ || !certificateService_ || !extender_ || !serials_ ||
        !validator_ || !locks_ || !restartHook_) {
        throw std::invalid_argument("CertificateAuthorityService: collaborators cannot be nullptr");
    }
}

// =============================================================================
// Create
// =============================================================================

CertificateView CertificateAuthorityService::create(const models::CaCreateRequest& request) {
    auto guard = locks_->acquire(OperationCategory::CaCreate);

    const std::string& name = models::requestName(request);

    common::ValidationErrors errors;
    validator_->validateCommonAttributes(kCreateSchema, models::commonAttributes(request), errors);
    validator_->validateName(kCreateSchema, name, errors);
    errors.throwIfAny();

    // Owned only while a serial is allocated and not yet stored
    infrastructure::OperationGuard serialGuard;

    CertificateRecord record = std::visit([this, &serialGuard](const auto& r) -> CertificateRecord {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, models::CreateInternalCa>) {
            return createInternal(r);
        } else if constexpr (std::is_same_v<T, models::ImportCa>) {
            return importCa(r);
        } else if constexpr (std::is_same_v<T, models::CreateIntermediateCa>) {
            return createIntermediate(r, serialGuard);
        } else {
            static_assert(std::is_void_v<T>, "unhandled CA request variant");
        }
    }, request);

    record.name = name;
    record.id = authorities_->insert(record);
    serialGuard.unlock();

    restartHook_->restart("certificate authority " + name + " created");
    spdlog::info("[CertificateAuthorityService] CA created: id={}, name={}, type={:#x}",
                 record.id, record.name, record.type);

    auto stored = authorities_->findById(record.id);
    return extender_->extend(stored ? *stored : record, Store::CertificateAuthority);
}

CertificateRecord CertificateAuthorityService::createInternal(const models::CreateInternalCa& r) {
    pki::SubjectFields subject = toSubjectFields(r.subject);
    pki::UniqueKey key = pki::generateRsaKey(r.keyLength);

    pki::UniqueCert cert = pki::createCertificate(subject, key.get(), r.lifetime);
    addCaExtensions(cert.get(), nullptr, "critical,CA:TRUE");

    int64_t serial = pki::randomSerial24();
    pki::setSerialNumber(cert.get(), serial);
    pki::signCertificate(cert.get(), key.get(), r.digestAlgorithm);

    CertificateRecord record;
    record.type = cert_type::CA_INTERNAL;
    applySubject(record, subject);
    record.certificate = pki::dumpCertificate(cert.get());
    record.privatekey = pki::dumpPrivateKey(key.get());
    record.serial = serial;
    record.keyLength = r.keyLength;
    record.digestAlgorithm = r.digestAlgorithm;
    record.lifetime = r.lifetime;
    return record;
}

CertificateRecord CertificateAuthorityService::importCa(const models::ImportCa& r) {
    CertificateRecord record;
    record.type = cert_type::CA_EXISTING;
    record.certificate = r.certificate;
    record.chain = hasChain(r.certificate);
    applyCertificateInfo(record, r.certificate);

    record.privatekey = r.privatekey;
    if (r.passphrase && !r.passphrase->empty() && r.privatekey && !r.privatekey->empty()) {
        record.privatekey = exportKeyWithoutPassphrase(*r.privatekey, *r.passphrase);
    }
    return record;
}

CertificateRecord CertificateAuthorityService::createIntermediate(const models::CreateIntermediateCa& r,
                                                                 infrastructure::OperationGuard& serialGuard) {
    auto parent = authorities_->findById(r.signedby);
    if (!parent || !parent->hasCertificate() || !parent->hasPrivateKey()) {
        throw common::PreconditionException(std::string(kCreateSchema) + ".signedby",
                                            "Please provide a valid signing authority");
    }

    pki::UniqueCert parentCert = pki::loadCertificate(*parent->certificate);
    pki::KeyLoadResult parentKey = pki::loadPrivateKey(*parent->privatekey);
    if (!parentCert || !parentKey.ok()) {
        throw common::PreconditionException(std::string(kCreateSchema) + ".signedby",
                                            "Please provide a valid signing authority");
    }

    pki::SubjectFields subject = toSubjectFields(r.subject);
    pki::UniqueKey key = pki::generateRsaKey(r.keyLength);

    pki::UniqueCert cert = pki::createCertificate(subject, key.get(), r.lifetime);

    // Held by create() until the record is stored
    serialGuard = locks_->acquire(OperationCategory::SerialAllocation);
    int64_t serial = serials_->next(parent->id);
    pki::setSerialNumber(cert.get(), serial);
    pki::setIssuerName(cert.get(), X509_get_subject_name(parentCert.get()));
    addCaExtensions(cert.get(), parentCert.get(), "critical,CA:TRUE, pathlen:0");
    pki::signCertificate(cert.get(), parentKey.key.get(), r.digestAlgorithm);

    CertificateRecord record;
    record.type = cert_type::CA_INTERMEDIATE;
    applySubject(record, subject);
    record.certificate = pki::dumpCertificate(cert.get());
    record.privatekey = pki::dumpPrivateKey(key.get());
    record.serial = serial;
    record.signedby = parent->id;
    record.keyLength = r.keyLength;
    record.digestAlgorithm = r.digestAlgorithm;
    record.lifetime = r.lifetime;
    return record;
}

// =============================================================================
// Sign CSR
// =============================================================================

CertificateView CertificateAuthorityService::signCsr(const models::CaSignCsrRequest& request,
                                                     common::ProgressReporter& progress) {
    const std::string caField = std::string(kUpdateSchema) + ".ca_id";
    const std::string csrField = std::string(kUpdateSchema) + ".csr_cert_id";

    common::ValidationErrors errors;

    auto ca = authorities_->findById(request.caId);
    if (!ca) {
        errors.add(caField, "No Certificate Authority found for id " + std::to_string(request.caId));
    } else if (!ca->hasPrivateKey() || !ca->hasCertificate()) {
        errors.add(caField, "Please use a CA which has a private key assigned");
    }

    auto csrRecord = certificates_->findById(request.csrCertId);
    pki::UniqueReq req;
    if (!csrRecord) {
        errors.add(csrField, "No Certificate found for id " + std::to_string(request.csrCertId));
    } else if (!csrRecord->hasCsr()) {
        errors.add(csrField, "No CSR has been filed by this certificate");
    } else {
        req = pki::loadCertificateRequest(*csrRecord->csr);
        if (!req) errors.add(csrField, "CSR not valid");
    }

    errors.throwIfAny();

    pki::UniqueCert caCert = pki::loadCertificate(*ca->certificate);
    pki::KeyLoadResult caKey = pki::loadPrivateKey(*ca->privatekey);
    if (!caCert || !caKey.ok()) {
        throw common::ValidationException(caField, "Please use a CA which has a private key assigned");
    }

    pki::UniqueCert cert = pki::createCertificate(pki::SubjectFields{}, X509_REQ_get0_pubkey(req.get()),
                                                  kSignedCsrLifetimeDays);
    pki::setSubjectName(cert.get(), X509_REQ_get_subject_name(req.get()));
    pki::setIssuerName(cert.get(), X509_get_subject_name(caCert.get()));
    const std::string digest = ca->digestAlgorithm.value_or("SHA256");

    models::CreateFromSignedCertificate signedRequest;
    signedRequest.name = request.name;
    signedRequest.privatekey = csrRecord->privatekey;
    signedRequest.type = cert_type::CERT_INTERNAL;
    signedRequest.signedby = ca->id;

    auto sign = [&cert, &caKey, &digest](int64_t serial) {
        pki::setSerialNumber(cert.get(), serial);
        pki::signCertificate(cert.get(), caKey.key.get(), digest);
        return pki::dumpCertificate(cert.get());
    };

    CertificateView view = certificateService_->createSigned(signedRequest, sign, progress);
    spdlog::info("[CertificateAuthorityService] CA {} signed CSR of certificate {}", ca->name,
                 csrRecord->name);
    return view;
}

// =============================================================================
// Update / Delete / Queries
// =============================================================================

CertificateView CertificateAuthorityService::update(int64_t id, const models::CaUpdateRequest& request,
                                                    common::ProgressReporter& progress) {
    auto guard = locks_->acquire(OperationCategory::CaUpdate);

    auto record = authorities_->findById(id);
    if (!record) {
        throw common::PreconditionException(std::string(kUpdateSchema) + ".id",
                                            "Certificate Authority " + std::to_string(id) + " does not exist");
    }

    if (request.createType && *request.createType == kSignCsrType) {
        common::ValidationErrors errors;
        if (!request.csrCertId) {
            errors.add(std::string(kUpdateSchema) + ".csr_cert_id", "This field is required");
        }
        if (!request.name || request.name->empty()) {
            errors.add(std::string(kUpdateSchema) + ".name", "This field is required");
        }
        errors.throwIfAny();

        models::CaSignCsrRequest signRequest;
        signRequest.caId = id;
        signRequest.csrCertId = *request.csrCertId;
        signRequest.name = *request.name;
        return signCsr(signRequest, progress);
    }

    if (request.name && *request.name != record->name) {
        common::ValidationErrors errors;
        validator_->validateName(kUpdateSchema, *request.name, errors);
        errors.throwIfAny();

        spdlog::info("[CertificateAuthorityService] Renaming CA {}: {} -> {}", id, record->name, *request.name);
        record->name = *request.name;
        authorities_->update(*record);
        restartHook_->restart("certificate authority " + record->name + " renamed");
    }

    return extender_->extend(*record, Store::CertificateAuthority);
}

void CertificateAuthorityService::remove(int64_t id) {
    auto guard = locks_->acquire(OperationCategory::CaDelete);

    auto record = authorities_->findById(id);
    if (!record) {
        throw common::PreconditionException("certificate_authority_delete.id",
                                            "Certificate Authority " + std::to_string(id) + " does not exist");
    }

    authorities_->remove(id);
    restartHook_->restart("certificate authority " + record->name + " deleted");
    spdlog::info("[CertificateAuthorityService] CA deleted: id={}, name={}", id, record->name);
}

std::vector<CertificateView> CertificateAuthorityService::list() {
    return extender_->extendAll(authorities_->findAll(), Store::CertificateAuthority);
}

std::optional<CertificateView> CertificateAuthorityService::get(int64_t id) {
    auto record = authorities_->findById(id);
    if (!record) return std::nullopt;
    return extender_->extend(*record, Store::CertificateAuthority);
}

} // namespace services
