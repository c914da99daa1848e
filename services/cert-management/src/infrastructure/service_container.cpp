/**
 * @file service_container.cpp
 * @brief ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include "db_connection_pool.h"
#include "i_query_executor.h"
#include "postgresql_query_executor.h"

#include "../repositories/acme_registration_repository.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/dns_authenticator_repository.h"
#include "../repositories/schema_bootstrap.h"
#include "../repositories/system_settings_repository.h"

#include "../adapters/acme/acme_client.h"
#include "../adapters/acme/http_transport.h"
#include "../adapters/dns/dns_authenticator.h"

#include "operation_locks.h"
#include "postgres_advisory_lock.h"
#include "service_restart_hook.h"

#include "../services/acme_issuance_service.h"
#include "../services/attribute_validator.h"
#include "../services/bootstrap_certificate.h"
#include "../services/certificate_authority_service.h"
#include "../services/certificate_paths.h"
#include "../services/certificate_service.h"
#include "../services/entity_extender.h"
#include "../services/serial_allocator.h"

#include <spdlog/spdlog.h>

namespace infrastructure {

struct ServiceContainer::Impl {
    // Connection pool
    std::unique_ptr<common::DbConnectionPool> dbPool;
    std::unique_ptr<common::IQueryExecutor> queryExecutor;

    // Repositories
    std::unique_ptr<repositories::ICertificateRepository> certificateRepository;
    std::unique_ptr<repositories::ICertificateRepository> authorityRepository;
    std::unique_ptr<repositories::IAcmeRegistrationRepository> acmeRegistrationRepository;
    std::unique_ptr<repositories::IDnsAuthenticatorRepository> dnsAuthenticatorRepository;
    std::unique_ptr<repositories::ISystemSettingsRepository> systemSettingsRepository;

    // Infrastructure and adapters
    std::unique_ptr<PostgresAdvisoryLock> advisoryLock;
    std::unique_ptr<OperationLocks> locks;
    std::unique_ptr<IServiceRestartHook> restartHook;
    std::unique_ptr<adapters::IHttpTransport> httpTransport;
    std::unique_ptr<adapters::IAcmeClient> acmeClient;
    std::unique_ptr<adapters::DnsAuthenticatorRegistry> dnsRegistry;

    // Services
    std::unique_ptr<services::EntityExtender> extender;
    std::unique_ptr<services::SerialAllocator> serialAllocator;
    std::unique_ptr<services::AttributeValidator> validator;
    std::unique_ptr<services::AcmeIssuanceService> acmeIssuanceService;
    std::unique_ptr<services::CertificateService> certificateService;
    std::unique_ptr<services::CertificateAuthorityService> certificateAuthorityService;
    std::unique_ptr<services::BootstrapCertificate> bootstrapCertificate;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    // Release in reverse order
    impl_->bootstrapCertificate.reset();
    impl_->certificateAuthorityService.reset();
    impl_->certificateService.reset();
    impl_->acmeIssuanceService.reset();
    impl_->validator.reset();
    impl_->serialAllocator.reset();
    impl_->extender.reset();

    impl_->dnsRegistry.reset();
    impl_->acmeClient.reset();
    impl_->httpTransport.reset();
    impl_->restartHook.reset();
    impl_->locks.reset();
    impl_->advisoryLock.reset();

    impl_->systemSettingsRepository.reset();
    impl_->dnsAuthenticatorRepository.reset();
    impl_->acmeRegistrationRepository.reset();
    impl_->authorityRepository.reset();
    impl_->certificateRepository.reset();

    impl_->queryExecutor.reset();
    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("[ServiceContainer] Initializing...");

    try {
        // --- 1. Database ---
        std::string connString = common::DbConnectionPool::buildConnString(
            config.dbHost, config.dbPort, config.dbName, config.dbUser, config.dbPassword);
        impl_->dbPool = std::make_unique<common::DbConnectionPool>(
            connString, static_cast<size_t>(config.dbPoolMin), static_cast<size_t>(config.dbPoolMax));
        if (!impl_->dbPool->initialize()) {
            spdlog::critical("[ServiceContainer] Database connection pool initialization failed");
            return false;
        }
        impl_->queryExecutor = std::make_unique<common::PostgreSQLQueryExecutor>(impl_->dbPool.get());
        spdlog::info("[ServiceContainer] Database pool ready ({}:{}/{})", config.dbHost, config.dbPort, config.dbName);

        // --- 2. Schema ---
        repositories::SchemaBootstrap(impl_->queryExecutor.get()).ensureSchema();

        // --- 3. Repositories ---
        auto* executor = impl_->queryExecutor.get();
        impl_->certificateRepository = std::make_unique<repositories::PgCertificateRepository>(
            executor, domain::models::Store::Certificate);
        impl_->authorityRepository = std::make_unique<repositories::PgCertificateRepository>(
            executor, domain::models::Store::CertificateAuthority);
        impl_->acmeRegistrationRepository = std::make_unique<repositories::PgAcmeRegistrationRepository>(executor);
        impl_->dnsAuthenticatorRepository = std::make_unique<repositories::PgDnsAuthenticatorRepository>(executor);
        impl_->systemSettingsRepository = std::make_unique<repositories::PgSystemSettingsRepository>(executor);

        // --- 4. Infrastructure and adapters ---
        services::CertificatePaths paths;
        paths.certRoot = config.certRootPath;
        paths.caRoot = config.certCaRootPath;

        impl_->advisoryLock = std::make_unique<PostgresAdvisoryLock>(connString);
        impl_->locks = std::make_unique<OperationLocks>(impl_->advisoryLock.get());
        impl_->restartHook = std::make_unique<CertificateMaterialWriter>(
            impl_->certificateRepository.get(), impl_->authorityRepository.get(), paths);
        impl_->httpTransport = std::make_unique<adapters::CurlHttpTransport>(config.acmeHttpTimeoutSec);
        impl_->acmeClient = std::make_unique<adapters::AcmeClient>(
            impl_->httpTransport.get(), std::chrono::seconds(config.acmePollIntervalSec));
        impl_->dnsRegistry = std::make_unique<adapters::DnsAuthenticatorRegistry>();

        // --- 5. Services ---
        impl_->extender = std::make_unique<services::EntityExtender>(impl_->authorityRepository.get(), paths);
        impl_->serialAllocator = std::make_unique<services::SerialAllocator>(
            impl_->certificateRepository.get(), impl_->authorityRepository.get());
        impl_->validator = std::make_unique<services::AttributeValidator>(
            impl_->certificateRepository.get(), impl_->authorityRepository.get());

        impl_->acmeIssuanceService = std::make_unique<services::AcmeIssuanceService>(
            impl_->certificateRepository.get(), impl_->acmeRegistrationRepository.get(),
            impl_->dnsAuthenticatorRepository.get(), impl_->acmeClient.get(), impl_->dnsRegistry.get(),
            impl_->locks.get(), impl_->restartHook.get(),
            std::chrono::seconds(config.acmeFinalizeTimeoutSec));

        impl_->certificateService = std::make_unique<services::CertificateService>(
            impl_->certificateRepository.get(), impl_->authorityRepository.get(),
            impl_->systemSettingsRepository.get(), impl_->acmeIssuanceService.get(),
            impl_->extender.get(), impl_->serialAllocator.get(), impl_->validator.get(),
            impl_->locks.get(), impl_->restartHook.get());

        impl_->certificateAuthorityService = std::make_unique<services::CertificateAuthorityService>(
            impl_->authorityRepository.get(), impl_->certificateRepository.get(),
            impl_->certificateService.get(), impl_->extender.get(), impl_->serialAllocator.get(),
            impl_->validator.get(), impl_->locks.get(), impl_->restartHook.get());

        impl_->bootstrapCertificate = std::make_unique<services::BootstrapCertificate>(
            impl_->certificateRepository.get(), impl_->systemSettingsRepository.get(),
            impl_->restartHook.get(), config.defaultCertName);

        spdlog::info("[ServiceContainer] Initialization complete");
        return true;
    } catch (const std::exception& e) {
        spdlog::critical("[ServiceContainer] Initialization failed: {}", e.what());
        return false;
    }
}

// --- Accessors ---

common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }

repositories::ICertificateRepository* ServiceContainer::certificateRepository() const {
    return impl_->certificateRepository.get();
}
repositories::ICertificateRepository* ServiceContainer::authorityRepository() const {
    return impl_->authorityRepository.get();
}
repositories::IAcmeRegistrationRepository* ServiceContainer::acmeRegistrationRepository() const {
    return impl_->acmeRegistrationRepository.get();
}
repositories::IDnsAuthenticatorRepository* ServiceContainer::dnsAuthenticatorRepository() const {
    return impl_->dnsAuthenticatorRepository.get();
}
repositories::ISystemSettingsRepository* ServiceContainer::systemSettingsRepository() const {
    return impl_->systemSettingsRepository.get();
}

adapters::DnsAuthenticatorRegistry* ServiceContainer::dnsAuthenticatorRegistry() const {
    return impl_->dnsRegistry.get();
}
OperationLocks* ServiceContainer::operationLocks() const { return impl_->locks.get(); }
IServiceRestartHook* ServiceContainer::restartHook() const { return impl_->restartHook.get(); }

services::CertificateService* ServiceContainer::certificateService() const {
    return impl_->certificateService.get();
}
services::CertificateAuthorityService* ServiceContainer::certificateAuthorityService() const {
    return impl_->certificateAuthorityService.get();
}
services::AcmeIssuanceService* ServiceContainer::acmeIssuanceService() const {
    return impl_->acmeIssuanceService.get();
}
services::BootstrapCertificate* ServiceContainer::bootstrapCertificate() const {
    return impl_->bootstrapCertificate.get();
}

} // namespace infrastructure
