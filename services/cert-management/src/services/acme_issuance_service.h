#pragma once

/**
 * @file acme_issuance_service.h
 * @brief ACME issuance orchestration and periodic renewal
 *
 * Drives one issuance attempt: DNS mapping validation, account resolution,
 * order placement, concurrent dns-01 authorizations and bounded
 * finalization. The renewal sweep re-runs issuance for ACME certificates
 * close to expiry.
 *
 * @date 2026-02-20
 */

#include "../adapters/acme/acme_client.h"
#include "../adapters/dns/dns_authenticator.h"
#include "../common/progress_reporter.h"
#include "../domain/models/certificate_record.h"
#include "../infrastructure/operation_locks.h"
#include "../infrastructure/service_restart_hook.h"
#include "../repositories/acme_registration_repository.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/dns_authenticator_repository.h"
#include "exceptions.h"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace services {

/// Inputs of one issuance attempt
struct IssuanceRequest {
    std::string directoryUri;
    std::map<std::string, int64_t> dnsMapping;     ///< Domain (as in CSR) -> authenticator id
    bool tos = false;
};

/// Outcome of a renewal sweep
struct RenewalReport {
    size_t checked = 0;
    std::vector<std::string> renewed;
    std::vector<std::string> failed;
};

/// CN followed by SAN entries, duplicates removed, order kept
std::vector<std::string> certificateDomainNames(const domain::models::CertificateRecord& record);

class AcmeIssuanceService {
public:
    /**
     * All pointers are non-owning.
     * @throws std::invalid_argument if any collaborator is nullptr
     */
    AcmeIssuanceService(repositories::ICertificateRepository* certificates,
                        repositories::IAcmeRegistrationRepository* registrations,
                        repositories::IDnsAuthenticatorRepository* dnsAuthenticators,
                        adapters::IAcmeClient* acmeClient,
                        adapters::DnsAuthenticatorRegistry* dnsRegistry,
                        infrastructure::OperationLocks* locks,
                        infrastructure::IServiceRestartHook* restartHook,
                        std::chrono::seconds finalizeTimeout = std::chrono::minutes(10));

    /**
     * @brief DNS mapping checks, raised together before any network call
     *
     * Errors are tagged "acme_create.dns_mapping".
     */
    void validateDnsMapping(const std::vector<std::string>& domains,
                            const std::map<std::string, int64_t>& dnsMapping,
                            common::ValidationErrors& errors);

    /**
     * @brief Issue a certificate for the CSR held by @p csrRecord
     * @param progress Reporter of the calling job
     * @param baseProgress Percentage at which this step starts
     * @throws common::ValidationException for mapping errors
     * @throws common::ProtocolException for order, challenge or DNS failures
     * @throws common::TimeoutException when finalization exceeds its bound
     */
    domain::models::FinalOrder issueCertificate(const domain::models::CertificateRecord& csrRecord,
                                                const IssuanceRequest& request,
                                                common::ProgressReporter& progress,
                                                double baseProgress);

    /// Registration for @p directoryUri, registering a new account if none exists
    domain::models::AcmeRegistration ensureRegistration(const std::string& directoryUri, bool tos);

    /**
     * @brief Revoke an ACME-issued certificate with reason 0 (unspecified)
     * @throws common::ProtocolException on failure
     */
    void revokeCertificate(const domain::models::CertificateRecord& record);

    /**
     * @brief Renew every ACME certificate whose remaining days fall below renew_days
     *
     * Holds the renewal lock for the whole sweep. A failing certificate is
     * logged and reported; the others still renew.
     */
    RenewalReport renewCertificates(common::ProgressReporter& progress);

private:
    void handleAuthorizations(const domain::models::AcmeRegistration& account,
                              const domain::models::AcmeOrder& order,
                              const std::map<std::string, int64_t>& dnsMapping,
                              common::ProgressReporter& progress,
                              double baseProgress);

    void authorizeDomain(const domain::models::AcmeRegistration& account,
                         const std::string& authorizationUri,
                         const std::map<std::string, int64_t>& dnsMapping,
                         std::string& domainOut);

    repositories::ICertificateRepository* certificates_;
    repositories::IAcmeRegistrationRepository* registrations_;
    repositories::IDnsAuthenticatorRepository* dnsAuthenticators_;
    adapters::IAcmeClient* acmeClient_;
    adapters::DnsAuthenticatorRegistry* dnsRegistry_;
    infrastructure::OperationLocks* locks_;
    infrastructure::IServiceRestartHook* restartHook_;
    std::chrono::seconds finalizeTimeout_;

    std::mutex registrationMutex_;
};

} // namespace services
