#pragma once

#include "../domain/models/certificate_record.h"

#include <string>

/**
 * @file certificate_paths.h
 * @brief On-disk locations of certificate material
 */

namespace services {

/**
 * @brief Root directories for certificates and CAs
 *
 * Files are <root>/<name>.crt, <root>/<name>.key and <root>/<name>.csr.
 */
struct CertificatePaths {
    std::string certRoot = "/etc/certificates";
    std::string caRoot = "/etc/certificates/CA";

    const std::string& rootFor(domain::models::Store store) const {
        return store == domain::models::Store::CertificateAuthority ? caRoot : certRoot;
    }

    std::string certificatePath(domain::models::Store store, const std::string& name) const {
        return rootFor(store) + "/" + name + ".crt";
    }

    std::string privatekeyPath(domain::models::Store store, const std::string& name) const {
        return rootFor(store) + "/" + name + ".key";
    }

    std::string csrPath(domain::models::Store store, const std::string& name) const {
        return rootFor(store) + "/" + name + ".csr";
    }
};

} // namespace services
