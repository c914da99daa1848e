/**
 * @file service_restart_hook.cpp
 * @brief CertificateMaterialWriter implementation
 */

#include "service_restart_hook.h"

#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace infrastructure {

namespace fs = std::filesystem;

namespace {

void writeFile(const std::string& path, const std::string& content, bool secret) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }

    std::error_code ec;
    fs::permissions(path,
                    secret ? (fs::perms::owner_read | fs::perms::owner_write)
                           : (fs::perms::owner_read | fs::perms::owner_write |
                              fs::perms::group_read | fs::perms::others_read),
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("[CertificateMaterialWriter] chmod {} failed: {}", path, ec.message());
    }
}

bool isMaterialFile(const fs::path& path) {
    auto ext = path.extension().string();
    return ext == ".crt" || ext == ".key" || ext == ".csr";
}

} // anonymous namespace

CertificateMaterialWriter::CertificateMaterialWriter(
    repositories::ICertificateRepository* certificates,
    repositories::ICertificateRepository* authorities,
    services::CertificatePaths paths)
    : certificates_(certificates), authorities_(authorities), paths_(std::move(paths))
{
    if (!certificates_ || !authorities_) {
        throw std::invalid_argument("CertificateMaterialWriter: repositories cannot be nullptr");
    }
}

void CertificateMaterialWriter::restart(const std::string& reason) {
    spdlog::info("[CertificateMaterialWriter] Applying certificate material ({})", reason);
    writeStore(authorities_, domain::models::Store::CertificateAuthority);
    writeStore(certificates_, domain::models::Store::Certificate);
}

void CertificateMaterialWriter::writeStore(repositories::ICertificateRepository* repo,
                                           domain::models::Store store) {
    const std::string& root = paths_.rootFor(store);
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + root + ": " + ec.message());
    }

    std::set<std::string> written;
    for (const auto& record : repo->findAll()) {
        if (record.hasCertificate()) {
            auto path = paths_.certificatePath(store, record.name);
            writeFile(path, *record.certificate, false);
            written.insert(path);
        }
        if (record.hasPrivateKey()) {
            auto path = paths_.privatekeyPath(store, record.name);
            writeFile(path, *record.privatekey, true);
            written.insert(path);
        }
        if (record.hasCsr()) {
            auto path = paths_.csrPath(store, record.name);
            writeFile(path, *record.csr, false);
            written.insert(path);
        }
    }

    // Drop material of deleted or renamed records. Only direct children are
    // considered so the CA root nested under the certificate root survives.
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (!entry.is_regular_file() || !isMaterialFile(entry.path())) continue;
        if (written.count(entry.path().string()) == 0) {
            fs::remove(entry.path(), ec);
            if (ec) {
                spdlog::warn("[CertificateMaterialWriter] Cannot remove stale {}: {}",
                             entry.path().string(), ec.message());
            } else {
                spdlog::debug("[CertificateMaterialWriter] Removed stale {}", entry.path().string());
            }
        }
    }
}

} // namespace infrastructure
