/**
 * @file serial_allocator.cpp
 * @brief SerialAllocator implementation
 */

#include "serial_allocator.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace services {

using domain::models::CertificateRecord;

SerialAllocator::SerialAllocator(repositories::ICertificateRepository* certificates,
                                 repositories::ICertificateRepository* authorities)
    : certificates_(certificates), authorities_(authorities)
{
    if (!certificates_ || !authorities_) {
        throw std::invalid_argument("SerialAllocator: repositories cannot be nullptr");
    }
}

int64_t SerialAllocator::next(int64_t caId) const {
    // Arena of CAs keyed by id, plus parent -> children adjacency
    std::map<int64_t, CertificateRecord> cas;
    std::map<int64_t, std::vector<int64_t>> childCas;
    for (auto& ca : authorities_->findAll()) {
        if (ca.signedby) childCas[*ca.signedby].push_back(ca.id);
        int64_t id = ca.id;
        cas.emplace(id, std::move(ca));
    }

    std::map<int64_t, std::vector<std::optional<int64_t>>> certSerialsByCa;
    for (const auto& cert : certificates_->findAll()) {
        if (cert.signedby) certSerialsByCa[*cert.signedby].push_back(cert.serial);
    }

    auto start = cas.find(caId);
    if (start == cas.end()) {
        spdlog::debug("[SerialAllocator] Unknown CA {}, starting at 1", caId);
        return 1;
    }

    // Climb to the top-level root
    int64_t rootId = caId;
    std::set<int64_t> climbed{rootId};
    for (;;) {
        const auto& current = cas.at(rootId);
        if (!current.signedby || cas.count(*current.signedby) == 0) break;
        if (!climbed.insert(*current.signedby).second) {
            spdlog::warn("[SerialAllocator] Signing cycle detected at CA {}", *current.signedby);
            break;
        }
        rootId = *current.signedby;
    }

    std::vector<std::optional<int64_t>> serials;
    std::set<int64_t> visited;
    std::vector<int64_t> stack{rootId};
    while (!stack.empty()) {
        int64_t id = stack.back();
        stack.pop_back();
        if (!visited.insert(id).second) continue;

        serials.push_back(cas.at(id).serial);
        auto certs = certSerialsByCa.find(id);
        if (certs != certSerialsByCa.end()) {
            serials.insert(serials.end(), certs->second.begin(), certs->second.end());
        }
        auto children = childCas.find(id);
        if (children != childCas.end()) {
            for (int64_t child : children->second) stack.push_back(child);
        }
    }

    int64_t maxSerial = 0;
    bool any = false;
    for (const auto& s : serials) {
        if (!s || *s == 0) continue;
        maxSerial = any ? std::max(maxSerial, *s) : *s;
        any = true;
    }

    int64_t result = (any ? maxSerial : 0) + 1;
    spdlog::debug("[SerialAllocator] CA {} (root {}): next serial {}", caId, rootId, result);
    return result;
}

} // namespace services
