#pragma once

#include "../../domain/models/acme_models.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @file dns_authenticator.h
 * @brief Contract for publishing dns-01 challenge records
 *
 * Provider backends (Route53, Cloudflare, ...) implement IDnsAuthenticator
 * and are registered by authenticator type. None are bundled.
 */

namespace adapters {

class IDnsAuthenticator {
public:
    virtual ~IDnsAuthenticator() = default;

    /**
     * @brief Publish _acme-challenge.<domain> TXT <txtValue> and wait for propagation
     * @param authenticator Configured provider credentials
     * @param domain Domain without "*." prefix
     * @throws common::ProtocolException on provider failure
     */
    virtual void updateTxtRecord(const domain::models::DnsAuthenticator& authenticator,
                                 const std::string& domain,
                                 const std::string& challengeToken,
                                 const std::string& txtValue) = 0;
};

/**
 * @brief Backend lookup by DnsAuthenticator::authenticator
 */
class DnsAuthenticatorRegistry {
public:
    void registerBackend(const std::string& type, std::shared_ptr<IDnsAuthenticator> backend);

    /// nullptr if no backend handles @p type
    std::shared_ptr<IDnsAuthenticator> find(const std::string& type) const;

    /**
     * @brief Dispatch to the backend for @p authenticator
     * @throws common::ProtocolException if no backend is registered
     */
    void updateTxtRecord(const domain::models::DnsAuthenticator& authenticator,
                         const std::string& domain,
                         const std::string& challengeToken,
                         const std::string& txtValue) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<IDnsAuthenticator>> backends_;
};

} // namespace adapters
