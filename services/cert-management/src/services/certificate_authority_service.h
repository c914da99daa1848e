#pragma once

/**
 * @file certificate_authority_service.h
 * @brief Certificate authority lifecycle and CSR signing
 *
 * @date 2026-02-21
 */

#include "../common/progress_reporter.h"
#include "../domain/models/certificate_view.h"
#include "../domain/models/create_request.h"
#include "../infrastructure/operation_locks.h"
#include "../infrastructure/service_restart_hook.h"
#include "../repositories/certificate_repository.h"
#include "attribute_validator.h"
#include "certificate_service.h"
#include "entity_extender.h"
#include "serial_allocator.h"

#include <optional>
#include <vector>

namespace services {

class CertificateAuthorityService {
public:
    /// @throws std::invalid_argument if any collaborator is nullptr
    CertificateAuthorityService(repositories::ICertificateRepository* authorities,
                                repositories::ICertificateRepository* certificates,
                                CertificateService* certificateService,
                                EntityExtender* extender,
                                SerialAllocator* serials,
                                AttributeValidator* validator,
                                infrastructure::OperationLocks* locks,
                                infrastructure::IServiceRestartHook* restartHook);

    /**
     * @brief Create a root, intermediate or imported CA
     * @throws common::ValidationException for the batched pre-validation errors
     */
    domain::models::CertificateView create(const domain::models::CaCreateRequest& request);

    /**
     * @brief Rename a CA, or sign a CSR with it when createType is CA_SIGN_CSR
     *
     * Returns the CA view after a rename and the new certificate's view
     * after signing.
     */
    domain::models::CertificateView update(int64_t id, const domain::models::CaUpdateRequest& request,
                                           common::ProgressReporter& progress);

    void remove(int64_t id);

    std::vector<domain::models::CertificateView> list();
    std::optional<domain::models::CertificateView> get(int64_t id);

    /**
     * @brief Issue a ten year certificate for a filed CSR
     *
     * Subject and public key come from the CSR; issuer, serial and digest
     * from the CA. The result is stored through the certificate service as
     * an internal certificate signed by the CA.
     *
     * @throws common::ValidationException listing every unusable CA or CSR field
     */
    domain::models::CertificateView signCsr(const domain::models::CaSignCsrRequest& request,
                                            common::ProgressReporter& progress);

private:
    domain::models::CertificateRecord createInternal(const domain::models::CreateInternalCa& r);
    domain::models::CertificateRecord importCa(const domain::models::ImportCa& r);
    domain::models::CertificateRecord createIntermediate(const domain::models::CreateIntermediateCa& r,
                                                         infrastructure::OperationGuard& serialGuard);

    repositories::ICertificateRepository* authorities_;
    repositories::ICertificateRepository* certificates_;
    CertificateService* certificateService_;
    EntityExtender* extender_;
    SerialAllocator* serials_;
    AttributeValidator* validator_;
    infrastructure::OperationLocks* locks_;
    infrastructure::IServiceRestartHook* restartHook_;
};

} // namespace services
