#pragma once

/**
 * @file certificate_service.h
 * @brief Certificate lifecycle: create, rename, delete and queries
 *
 * Creation dispatches on the request variant after name and common
 * attribute validation. Each workflow holds its operation lock for the
 * whole run and notifies the restart hook after persisting.
 *
 * @date 2026-02-20
 */

#include "../common/progress_reporter.h"
#include "../domain/models/certificate_view.h"
#include "../domain/models/create_request.h"
#include "../infrastructure/operation_locks.h"
#include "../infrastructure/service_restart_hook.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/system_settings_repository.h"
#include "acme_issuance_service.h"
#include "attribute_validator.h"
#include "entity_extender.h"
#include "serial_allocator.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace services {

class CertificateService {
public:
    /**
     * All pointers are non-owning.
     * @throws std::invalid_argument if any collaborator is nullptr
     */
    CertificateService(repositories::ICertificateRepository* certificates,
                       repositories::ICertificateRepository* authorities,
                       repositories::ISystemSettingsRepository* settings,
                       AcmeIssuanceService* acme,
                       EntityExtender* extender,
                       SerialAllocator* serials,
                       AttributeValidator* validator,
                       infrastructure::OperationLocks* locks,
                       infrastructure::IServiceRestartHook* restartHook);

    /**
     * @brief Create a certificate from any request variant
     * @throws common::ValidationException for the batched pre-validation errors
     * @throws common::ProtocolException / common::TimeoutException for ACME failures
     */
    domain::models::CertificateView create(const domain::models::CertificateCreateRequest& request,
                                           common::ProgressReporter& progress);

    /// Receives the allocated serial, returns the signed certificate PEM
    using SignWithSerial = std::function<std::string(int64_t serial)>;

    /**
     * @brief Store a certificate signed by the CA in @p request.signedby
     *
     * The serial is allocated from that CA's hierarchy and handed to
     * @p sign; allocation, signing and insert run under SerialAllocation so
     * no concurrent create can reuse the serial. @p request.certificate is
     * replaced by the result of @p sign.
     *
     * @throws std::invalid_argument if @p request.signedby is not set
     * @throws common::ValidationException if the name is invalid or taken
     */
    domain::models::CertificateView createSigned(domain::models::CreateFromSignedCertificate request,
                                                 const SignWithSerial& sign,
                                                 common::ProgressReporter& progress);

    /// Rename; other attributes are immutable
    domain::models::CertificateView update(int64_t id, const std::optional<std::string>& name,
                                           common::ProgressReporter& progress);

    /**
     * @brief Delete, revoking ACME certificates first
     * @param force Delete even if revocation fails
     * @throws common::PolicyException for the certificate serving the UI
     */
    void remove(int64_t id, bool force, common::ProgressReporter& progress);

    std::vector<domain::models::CertificateView> list();
    std::optional<domain::models::CertificateView> get(int64_t id);

    /// SHA-1 fingerprint "AA:BB:..", nullopt if the certificate does not decode
    std::optional<std::string> fingerprint(int64_t id);

    /**
     * @brief SHA-1 fingerprint of the certificate served at @p hostname:@p port
     * @return nullopt if the host does not resolve or refuses the connection
     * @throws common::ValidationException for an empty host or a port outside 1-65535
     * @throws certmgr::pki::CryptoError if the TLS handshake fails
     */
    std::optional<std::string> hostCertificateFingerprint(const std::string& hostname, int port);

    std::vector<std::string> domainNames(int64_t id);

    /// Drop @p authenticatorId from every ACME certificate's domain mapping
    void removeDomainsAuthenticator(int64_t authenticatorId);

    /// Well-known ACME directories with display labels
    static std::map<std::string, std::string> acmeServerChoices();

private:
    domain::models::CertificateRecord createInternal(const domain::models::CreateInternalCertificate& r,
                                                     common::ProgressReporter& progress,
                                                     infrastructure::OperationGuard& serialGuard);
    domain::models::CertificateRecord importCertificate(const domain::models::ImportCertificate& r,
                                                        common::ProgressReporter& progress);
    domain::models::CertificateRecord createCsr(const domain::models::CreateCsr& r,
                                                common::ProgressReporter& progress);
    domain::models::CertificateRecord importCsr(const domain::models::ImportCsr& r,
                                                common::ProgressReporter& progress);
    domain::models::CertificateRecord createAcme(const domain::models::CreateAcmeCertificate& r,
                                                 common::ProgressReporter& progress);
    domain::models::CertificateRecord createFromSigned(const domain::models::CreateFromSignedCertificate& r,
                                                       common::ProgressReporter& progress);

    /// Insert, release @p serialGuard, notify the restart hook and return the stored view
    domain::models::CertificateView store(domain::models::CertificateRecord record,
                                          infrastructure::OperationGuard& serialGuard,
                                          common::ProgressReporter& progress);

    domain::models::CertificateRecord requireRecord(int64_t id, const std::string& field);

    repositories::ICertificateRepository* certificates_;
    repositories::ICertificateRepository* authorities_;
    repositories::ISystemSettingsRepository* settings_;
    AcmeIssuanceService* acme_;
    EntityExtender* extender_;
    SerialAllocator* serials_;
    AttributeValidator* validator_;
    infrastructure::OperationLocks* locks_;
    infrastructure::IServiceRestartHook* restartHook_;
};

} // namespace services
