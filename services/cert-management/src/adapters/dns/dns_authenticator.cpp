/**
 * @file dns_authenticator.cpp
 * @brief DnsAuthenticatorRegistry implementation
 */

#include "dns_authenticator.h"
#include "exceptions.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace adapters {

void DnsAuthenticatorRegistry::registerBackend(const std::string& type,
                                               std::shared_ptr<IDnsAuthenticator> backend) {
    if (!backend) {
        throw std::invalid_argument("DnsAuthenticatorRegistry: backend cannot be nullptr");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    backends_[type] = std::move(backend);
    spdlog::info("[DnsAuthenticatorRegistry] Registered backend '{}'", type);
}

std::shared_ptr<IDnsAuthenticator> DnsAuthenticatorRegistry::find(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(type);
    return it != backends_.end() ? it->second : nullptr;
}

void DnsAuthenticatorRegistry::updateTxtRecord(const domain::models::DnsAuthenticator& authenticator,
                                               const std::string& domain,
                                               const std::string& challengeToken,
                                               const std::string& txtValue) const {
    auto backend = find(authenticator.authenticator);
    if (!backend) {
        throw common::ProtocolException("No DNS authenticator backend for type '" +
                                        authenticator.authenticator + "'");
    }
    spdlog::debug("[DnsAuthenticatorRegistry] {} -> {} ({})", domain, authenticator.name,
                  authenticator.authenticator);
    backend->updateTxtRecord(authenticator, domain, challengeToken, txtValue);
}

} // namespace adapters
