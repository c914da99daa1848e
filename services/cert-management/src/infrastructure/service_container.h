#pragma once

/**
 * @file service_container.h
 * @brief Owns the connection pool, repositories, adapters and services
 *
 * Provides non-owning pointer accessors for dependency injection.
 *
 * @date 2026-02-22
 */

#include <memory>

struct AppConfig;

namespace common {
    class IQueryExecutor;
}

namespace repositories {
    class ICertificateRepository;
    class IAcmeRegistrationRepository;
    class IDnsAuthenticatorRepository;
    class ISystemSettingsRepository;
}

namespace adapters {
    class DnsAuthenticatorRegistry;
}

namespace services {
    class CertificateService;
    class CertificateAuthorityService;
    class AcmeIssuanceService;
    class BootstrapCertificate;
}

namespace infrastructure {

class OperationLocks;
class IServiceRestartHook;

/**
 * @brief Application dependency container
 *
 * Initialization order:
 * 1. Database connection pool + Query Executor
 * 2. Schema bootstrap
 * 3. Repositories
 * 4. Locks, restart hook, ACME transport and client, DNS registry
 * 5. Business logic services
 */
class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /// Release all resources (called automatically by destructor)
    void shutdown();

    common::IQueryExecutor* queryExecutor() const;

    repositories::ICertificateRepository* certificateRepository() const;
    repositories::ICertificateRepository* authorityRepository() const;
    repositories::IAcmeRegistrationRepository* acmeRegistrationRepository() const;
    repositories::IDnsAuthenticatorRepository* dnsAuthenticatorRepository() const;
    repositories::ISystemSettingsRepository* systemSettingsRepository() const;

    adapters::DnsAuthenticatorRegistry* dnsAuthenticatorRegistry() const;
    OperationLocks* operationLocks() const;
    IServiceRestartHook* restartHook() const;

    services::CertificateService* certificateService() const;
    services::CertificateAuthorityService* certificateAuthorityService() const;
    services::AcmeIssuanceService* acmeIssuanceService() const;
    services::BootstrapCertificate* bootstrapCertificate() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
