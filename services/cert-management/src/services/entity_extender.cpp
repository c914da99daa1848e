/**
 * @file entity_extender.cpp
 * @brief EntityExtender implementation
 */

#include "entity_extender.h"

#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/pem.h>
#include <certmgr/pki/san.h>

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace services {

using domain::models::CertificateRecord;
using domain::models::CertificateView;
using domain::models::Store;
namespace cert_type = domain::models::cert_type;
namespace pki = certmgr::pki;

namespace {

/// Parse and re-dump one PEM certificate; empty on failure
std::string normalizeCertificate(const std::string& pem, const std::string& name) {
    pki::UniqueCert cert = pki::loadCertificate(pem);
    if (!cert) {
        spdlog::debug("[EntityExtender] Failed to load certificate {}", name);
        return {};
    }
    try {
        return pki::dumpCertificate(cert.get());
    } catch (const pki::CryptoError& e) {
        spdlog::debug("[EntityExtender] Failed to dump certificate {}: {}", name, e.what());
        return {};
    }
}

} // anonymous namespace

EntityExtender::EntityExtender(repositories::ICertificateRepository* authorities,
                               CertificatePaths paths)
    : authorities_(authorities), paths_(std::move(paths))
{
    if (!authorities_) {
        throw std::invalid_argument("EntityExtender: authorities repository cannot be nullptr");
    }
}

CertificateView EntityExtender::extend(const CertificateRecord& record, Store store) const {
    std::set<int64_t> visited;
    return extendGuarded(record, store, visited);
}

std::vector<CertificateView> EntityExtender::extendAll(const std::vector<CertificateRecord>& records,
                                                       Store store) const {
    std::vector<CertificateView> views;
    views.reserve(records.size());
    for (const auto& record : records) {
        views.push_back(extend(record, store));
    }
    return views;
}

std::optional<domain::models::Issuer> EntityExtender::resolveIssuer(const CertificateRecord& record,
                                                                    std::set<int64_t>& visitedCas) const {
    if (cert_type::isExisting(record.type)) {
        return domain::models::ExternalIssuer{};
    }
    if (record.type == cert_type::CA_INTERNAL) {
        return domain::models::SelfSignedIssuer{};
    }
    if (record.type == cert_type::CERT_CSR) {
        return domain::models::PendingSignatureIssuer{};
    }
    if (record.type != cert_type::CERT_INTERNAL && record.type != cert_type::CA_INTERMEDIATE) {
        return std::nullopt;
    }

    if (!record.signedby) return std::nullopt;
    if (visitedCas.count(*record.signedby)) {
        spdlog::warn("[EntityExtender] Signing cycle at CA {} while resolving {}",
                     *record.signedby, record.name);
        return std::nullopt;
    }

    auto parent = authorities_->findById(*record.signedby);
    if (!parent) {
        spdlog::debug("[EntityExtender] Signing CA {} of {} not found", *record.signedby, record.name);
        return std::nullopt;
    }

    auto parentView = std::make_shared<const CertificateView>(
        extendGuarded(*parent, Store::CertificateAuthority, visitedCas));
    return domain::models::SignedByIssuer{parentView};
}

CertificateView EntityExtender::extendGuarded(const CertificateRecord& record, Store store,
                                              std::set<int64_t>& visitedCas) const {
    CertificateView view;
    view.record = record;
    view.store = store;

    if (store == Store::CertificateAuthority) {
        visitedCas.insert(record.id);
    }

    view.san = pki::splitSan(record.san);

    view.rootPath = paths_.rootFor(store);
    view.certificatePath = paths_.certificatePath(store, record.name);
    view.privatekeyPath = paths_.privatekeyPath(store, record.name);
    view.csrPath = paths_.csrPath(store, record.name);

    view.issuer = resolveIssuer(record, visitedCas);

    // --- Chain ---
    std::vector<std::string> blobs;
    if (record.chain) {
        if (record.certificate) blobs = pki::splitPemBlocks(*record.certificate);
    } else {
        if (record.certificate) blobs.push_back(*record.certificate);
        for (const CertificateView* ca = view.signingAuthority(); ca; ca = ca->signingAuthority()) {
            if (ca->record.certificate) blobs.push_back(*ca->record.certificate);
        }
    }
    for (const auto& blob : blobs) {
        if (blob.empty()) continue;
        std::string pem = normalizeCertificate(blob, record.name);
        if (!pem.empty()) view.chainList.push_back(std::move(pem));
    }

    // --- Re-encoded key material ---
    if (record.hasPrivateKey()) {
        pki::KeyLoadResult key = pki::loadPrivateKey(*record.privatekey);
        if (key.ok()) {
            try {
                view.record.privatekey = pki::dumpPrivateKey(key.key.get());
            } catch (const pki::CryptoError& e) {
                spdlog::debug("[EntityExtender] Failed to dump privatekey {}: {}", record.name, e.what());
            }
        } else {
            spdlog::debug("[EntityExtender] Failed to load privatekey {}", record.name);
        }
    }

    pki::UniqueReq req;
    if (record.hasCsr()) {
        req = pki::loadCertificateRequest(*record.csr);
        if (req) {
            try {
                view.record.csr = pki::dumpCertificateRequest(req.get());
            } catch (const pki::CryptoError& e) {
                spdlog::debug("[EntityExtender] Failed to dump CSR {}: {}", record.name, e.what());
            }
        } else {
            spdlog::debug("[EntityExtender] Failed to load CSR {}", record.name);
        }
    }

    view.internal = !cert_type::isExisting(record.type);

    // --- Validity and DN ---
    if (record.type == cert_type::CERT_CSR) {
        if (req) view.dn = pki::getRequestSubjectDn(req.get());
    } else if (!view.chainList.empty() && record.certificate) {
        pki::UniqueCert leaf = pki::loadCertificate(*record.certificate);
        if (leaf) {
            view.from = pki::getNotBefore(leaf.get());
            view.until = pki::getNotAfter(leaf.get());
            view.dn = pki::getSubjectDn(leaf.get());
        }
    }

    return view;
}

} // namespace services
