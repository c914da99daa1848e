#pragma once

/**
 * @file service_restart_hook.h
 * @brief Notification after persisted certificate changes
 *
 * Every create, update and delete ends with restart(reason) so that
 * services consuming the material (HTTPS UI, directory services) reload.
 * The shipped implementation rewrites certificate material on disk.
 */

#include "../repositories/certificate_repository.h"
#include "../services/certificate_paths.h"

#include <string>

namespace infrastructure {

class IServiceRestartHook {
public:
    virtual ~IServiceRestartHook() = default;

    /**
     * @brief Apply the current certificate state
     * @throws std::runtime_error when the material cannot be written
     */
    virtual void restart(const std::string& reason) = 0;
};

/**
 * @brief Writes .crt/.key/.csr files for every record under the configured roots
 *
 * Private keys are written with mode 0600. Material files whose record no
 * longer exists are removed.
 */
class CertificateMaterialWriter : public IServiceRestartHook {
public:
    /**
     * @param certificates Non-owning
     * @param authorities Non-owning
     * @throws std::invalid_argument if either repository is nullptr
     */
    CertificateMaterialWriter(repositories::ICertificateRepository* certificates,
                              repositories::ICertificateRepository* authorities,
                              services::CertificatePaths paths);

    void restart(const std::string& reason) override;

private:
    void writeStore(repositories::ICertificateRepository* repo, domain::models::Store store);

    repositories::ICertificateRepository* certificates_;
    repositories::ICertificateRepository* authorities_;
    services::CertificatePaths paths_;
};

} // namespace infrastructure
