/**
 * @file acme_issuance_service.cpp
 * @brief AcmeIssuanceService implementation
 */

#include "acme_issuance_service.h"

#include <certmgr/pki/cert_builder.h>
#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/pem.h>
#include <certmgr/pki/san.h>

#include <algorithm>
#include <exception>
#include <future>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace services {

using domain::models::AcmeAuthorization;
using domain::models::AcmeChallenge;
using domain::models::AcmeOrder;
using domain::models::AcmeRegistration;
using domain::models::CertificateRecord;
using domain::models::FinalOrder;
using infrastructure::OperationCategory;
namespace pki = certmgr::pki;

namespace {

constexpr const char* kDnsMappingField = "acme_create.dns_mapping";
constexpr const char* kDns01 = "dns-01";

std::string stripWildcard(const std::string& domain) {
    return domain.rfind("*.", 0) == 0 ? domain.substr(2) : domain;
}

} // anonymous namespace

std::vector<std::string> certificateDomainNames(const CertificateRecord& record) {
    std::vector<std::string> names;
    auto addName = [&names](const std::string& name) {
        if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    };

    if (record.common) addName(*record.common);
    for (const auto& san : pki::splitSan(record.san)) addName(san);
    return names;
}

AcmeIssuanceService::AcmeIssuanceService(repositories::ICertificateRepository* certificates,
                                         repositories::IAcmeRegistrationRepository* registrations,
                                         repositories::IDnsAuthenticatorRepository* dnsAuthenticators,
                                         adapters::IAcmeClient* acmeClient,
                                         adapters::DnsAuthenticatorRegistry* dnsRegistry,
                                         infrastructure::OperationLocks* locks,
                                         infrastructure::IServiceRestartHook* restartHook,
                                         std::chrono::seconds finalizeTimeout)
    : certificates_(certificates), registrations_(registrations),
      dnsAuthenticators_(dnsAuthenticators), acmeClient_(acmeClient),
      dnsRegistry_(dnsRegistry), locks_(locks), restartHook_(restartHook),
      finalizeTimeout_(finalizeTimeout)
{
    if (!certificates_ || !registrations_ || !dnsAuthenticators_ || !acmeClient_ ||
        !dnsRegistry_ || !locks_ || !restartHook_) {
        throw std::invalid_argument("AcmeIssuanceService: collaborators cannot be nullptr");
    }
}

// =============================================================================
// Validation
// =============================================================================

void AcmeIssuanceService::validateDnsMapping(const std::vector<std::string>& domains,
                                             const std::map<std::string, int64_t>& dnsMapping,
                                             common::ValidationErrors& errors) {
    std::set<int64_t> authenticatorIds;
    for (const auto& authenticator : dnsAuthenticators_->findAll()) {
        authenticatorIds.insert(authenticator.id);
    }

    for (const auto& domain : domains) {
        auto mapped = dnsMapping.find(domain);
        if (mapped == dnsMapping.end()) {
            errors.add(kDnsMappingField, "Please provide DNS authenticator id for " + domain);
        } else if (authenticatorIds.count(mapped->second) == 0) {
            errors.add(kDnsMappingField, "Provided DNS Authenticator id for " + domain + " does not exist");
        }
        if (!domain.empty() && domain.back() == '.') {
            errors.add(kDnsMappingField, "Domain " + domain + " name cannot end with a period");
        }
        if (domain.find('*') != std::string::npos && domain.rfind("*.", 0) != 0) {
            errors.add(kDnsMappingField, "Wildcards must be at the start of domain name followed by a period");
        }
    }

    for (const auto& [domain, authenticatorId] : dnsMapping) {
        (void)authenticatorId;
        if (std::find(domains.begin(), domains.end(), domain) == domains.end()) {
            errors.add(kDnsMappingField, domain + " not specified in the CSR");
        }
    }
}

// =============================================================================
// Account
// =============================================================================

AcmeRegistration AcmeIssuanceService::ensureRegistration(const std::string& directoryUri, bool tos) {
    std::lock_guard<std::mutex> lock(registrationMutex_);

    if (auto existing = registrations_->findByDirectory(directoryUri)) {
        return *existing;
    }

    spdlog::info("[AcmeIssuanceService] Registering ACME account for {}", directoryUri);

    AcmeRegistration registration;
    try {
        pki::UniqueKey accountKey = pki::generateRsaKey(2048);
        registration.privateKeyPem = pki::dumpPrivateKey(accountKey.get());
    } catch (const pki::CryptoError& e) {
        throw common::ProtocolException(std::string("Unable to create ACME account key: ") + e.what());
    }

    auto directory = acmeClient_->fetchDirectory(directoryUri);
    registration.uri = acmeClient_->registerAccount(directory, registration.privateKeyPem, tos);
    registration.directory = directoryUri;
    registration.tos = directory.termsOfService;
    registration.newAccountUri = directory.newAccount;
    registration.newNonceUri = directory.newNonce;
    registration.newOrderUri = directory.newOrder;
    registration.revokeCertUri = directory.revokeCert;
    registration.status = "valid";

    registration.id = registrations_->insert(registration);
    return registration;
}

// =============================================================================
// Issuance
// =============================================================================

FinalOrder AcmeIssuanceService::issueCertificate(const CertificateRecord& csrRecord,
                                                 const IssuanceRequest& request,
                                                 common::ProgressReporter& progress,
                                                 double baseProgress) {
    std::vector<std::string> domains = certificateDomainNames(csrRecord);

    common::ValidationErrors errors;
    validateDnsMapping(domains, request.dnsMapping, errors);
    errors.throwIfAny();

    if (!csrRecord.hasCsr()) {
        throw common::PreconditionException("acme_create.csr_id", "No CSR has been filed by this certificate");
    }

    AcmeRegistration account = ensureRegistration(request.directoryUri, request.tos);

    AcmeOrder order;
    try {
        order = acmeClient_->newOrder(account, domains);
    } catch (const common::ProtocolException& e) {
        throw common::ProtocolException(std::string("Failed to issue a new order for Certificate : ") + e.what());
    }
    progress.set(baseProgress, "New order for certificate issuance placed");

    handleAuthorizations(account, order, request.dnsMapping, progress, baseProgress);

    FinalOrder finalOrder = acmeClient_->pollAndFinalize(account, order, *csrRecord.csr, finalizeTimeout_);
    finalOrder.registrationId = account.id;
    return finalOrder;
}

void AcmeIssuanceService::handleAuthorizations(const AcmeRegistration& account,
                                               const AcmeOrder& order,
                                               const std::map<std::string, int64_t>& dnsMapping,
                                               common::ProgressReporter& progress,
                                               double baseProgress) {
    if (order.authorizationUris.empty()) return;

    const double maxProgress = (baseProgress * 4) - baseProgress - (baseProgress * 4 / 5);
    const double step = maxProgress / static_cast<double>(order.authorizationUris.size());

    // Authorization identifiers never carry the "*." prefix
    std::map<std::string, int64_t> mapping;
    for (const auto& [domain, authenticatorId] : dnsMapping) {
        mapping[stripWildcard(domain)] = authenticatorId;
    }

    std::mutex progressMutex;
    double current = baseProgress;
    auto finish = [&](const std::string& domain, bool completed) {
        double value;
        {
            std::lock_guard<std::mutex> lock(progressMutex);
            current += step;
            value = current;
        }
        progress.set(value, std::string("DNS challenge ") + (completed ? "completed" : "failed") +
                                " for " + domain);
    };

    std::vector<std::future<void>> tasks;
    tasks.reserve(order.authorizationUris.size());
    for (const auto& uri : order.authorizationUris) {
        tasks.push_back(std::async(std::launch::async, [&, uri]() {
            std::string domain = uri;
            try {
                authorizeDomain(account, uri, mapping, domain);
            } catch (const std::exception& e) {
                spdlog::error("[AcmeIssuanceService] Authorization for {} failed: {}", domain, e.what());
                finish(domain, false);
                throw;
            }
            finish(domain, true);
        }));
    }

    // Every domain runs to completion; the first failure is raised afterwards
    std::exception_ptr firstError;
    for (auto& task : tasks) {
        try {
            task.get();
        } catch (const std::exception&) {
            if (!firstError) firstError = std::current_exception();
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

void AcmeIssuanceService::authorizeDomain(const AcmeRegistration& account,
                                          const std::string& authorizationUri,
                                          const std::map<std::string, int64_t>& dnsMapping,
                                          std::string& domainOut) {
    AcmeAuthorization authz = acmeClient_->fetchAuthorization(account, authorizationUri);
    const std::string domain = authz.identifier;
    domainOut = domain;

    if (authz.status == "valid") {
        spdlog::debug("[AcmeIssuanceService] {} already authorized", domain);
        return;
    }

    const AcmeChallenge* challenge = nullptr;
    for (const auto& c : authz.challenges) {
        if (c.type == kDns01) challenge = &c;
    }
    if (!challenge) {
        throw common::ProtocolException("DNS Challenge not found for domain " + domain);
    }

    auto mapped = dnsMapping.find(domain);
    if (mapped == dnsMapping.end()) {
        throw common::ProtocolException("Please provide DNS authenticator id for " + domain);
    }
    auto authenticator = dnsAuthenticators_->findById(mapped->second);
    if (!authenticator) {
        throw common::ProtocolException("Provided DNS Authenticator id for " + domain + " does not exist");
    }

    std::string txtValue = acmeClient_->dnsTxtValue(account, challenge->token);
    dnsRegistry_->updateTxtRecord(*authenticator, domain, challenge->token, txtValue);

    try {
        acmeClient_->answerChallenge(account, *challenge);
    } catch (const common::ProtocolException& e) {
        throw common::ProtocolException("Error answering challenge for " + domain + " : " + e.what());
    }
}

// =============================================================================
// Revocation
// =============================================================================

void AcmeIssuanceService::revokeCertificate(const CertificateRecord& record) {
    if (!record.acme) {
        throw common::ProtocolException("Certificate " + record.name + " was not issued via ACME");
    }
    auto account = registrations_->findById(*record.acme);
    if (!account) {
        throw common::ProtocolException("ACME registration " + std::to_string(*record.acme) + " not found");
    }
    if (!record.hasCertificate()) {
        throw common::ProtocolException("Certificate " + record.name + " has no certificate to revoke");
    }
    acmeClient_->revokeCertificate(*account, *record.certificate, 0);
}

// =============================================================================
// Renewal
// =============================================================================

RenewalReport AcmeIssuanceService::renewCertificates(common::ProgressReporter& progress) {
    auto guard = locks_->acquire(OperationCategory::AcmeRenewal);

    RenewalReport report;
    std::vector<CertificateRecord> certs = certificates_->findAcmeIssued();
    report.checked = certs.size();
    spdlog::info("[AcmeIssuanceService] Renewal sweep over {} ACME certificate(s)", certs.size());

    double value = 0.0;
    for (auto& cert : certs) {
        value += 100.0 / static_cast<double>(certs.size());

        try {
            pki::UniqueCert leaf;
            if (cert.hasCertificate()) leaf = pki::loadCertificate(*cert.certificate);
            std::optional<int> remaining;
            if (leaf) remaining = pki::daysUntilExpiry(leaf.get());
            if (!remaining) {
                throw common::ProtocolException("Stored certificate cannot be decoded");
            }

            if (*remaining < cert.renewDays.value_or(10)) {
                spdlog::debug("[AcmeIssuanceService] Renewing certificate {} ({} day(s) left)",
                              cert.name, *remaining);

                auto account = registrations_->findById(*cert.acme);
                if (!account) {
                    throw common::ProtocolException("ACME registration " + std::to_string(*cert.acme) +
                                                    " not found");
                }

                IssuanceRequest request;
                request.directoryUri = account->directory;
                request.dnsMapping = cert.domainsAuthenticators;
                request.tos = true;

                FinalOrder finalOrder = issueCertificate(cert, request, progress, value / 4);

                cert.certificate = finalOrder.fullchainPem;
                cert.acmeUri = finalOrder.uri;
                cert.chain = pki::splitPemBlocks(finalOrder.fullchainPem).size() > 1;
                certificates_->update(cert);

                report.renewed.push_back(cert.name);
                spdlog::info("[AcmeIssuanceService] Renewed certificate {}", cert.name);
            }
        } catch (const std::exception& e) {
            spdlog::error("[AcmeIssuanceService] Renewal of {} failed: {}", cert.name, e.what());
            report.failed.push_back(cert.name);
        }

        progress.set(value);
    }

    if (!report.renewed.empty()) {
        restartHook_->restart("ACME certificate renewal");
    }

    spdlog::info("[AcmeIssuanceService] Renewal sweep done: checked={}, renewed={}, failed={}",
                 report.checked, report.renewed.size(), report.failed.size());
    return report;
}

} // namespace services
