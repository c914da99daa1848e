#pragma once

/**
 * @file bootstrap_certificate.h
 * @brief Ensures the administrative UI has a serving certificate at startup
 */

#include "../infrastructure/service_restart_hook.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/system_settings_repository.h"

#include <cstdint>
#include <optional>
#include <string>

namespace services {

class BootstrapCertificate {
public:
    BootstrapCertificate(repositories::ICertificateRepository* certificates,
                         repositories::ISystemSettingsRepository* settings,
                         infrastructure::IServiceRestartHook* restartHook,
                         std::string defaultName);

    /**
     * @brief Assign a serving certificate if none is set or it was deleted
     *
     * Reuses the certificate named after the default name when present,
     * otherwise creates a self-signed localhost certificate. Failures are
     * logged and never propagate.
     *
     * @return Id of the serving certificate, nullopt on failure
     */
    std::optional<int64_t> ensure();

private:
    int64_t createDefault();

    repositories::ICertificateRepository* certificates_;
    repositories::ISystemSettingsRepository* settings_;
    infrastructure::IServiceRestartHook* restartHook_;
    std::string defaultName_;
};

} // namespace services
