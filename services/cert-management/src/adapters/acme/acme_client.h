#pragma once

#include "../../domain/models/acme_models.h"
#include "http_transport.h"
#include "jws.h"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @file acme_client.h
 * @brief ACME v2 protocol client (RFC 8555)
 *
 * Covers the subset certificate issuance needs: directory discovery,
 * account registration, orders, dns-01 challenges, finalization and
 * revocation. All requests after the directory fetch are JWS-signed POSTs.
 *
 * @date 2026-02-20
 */

namespace adapters {

class IAcmeClient {
public:
    virtual ~IAcmeClient() = default;

    virtual domain::models::AcmeDirectory fetchDirectory(const std::string& directoryUri) = 0;

    /**
     * @brief Create (or look up) the account for @p accountKeyPem
     * @return Account URL used as JWS kid afterwards
     */
    virtual std::string registerAccount(const domain::models::AcmeDirectory& directory,
                                        const std::string& accountKeyPem, bool termsAgreed) = 0;

    virtual domain::models::AcmeOrder newOrder(const domain::models::AcmeRegistration& account,
                                               const std::vector<std::string>& domains) = 0;

    virtual domain::models::AcmeAuthorization fetchAuthorization(
        const domain::models::AcmeRegistration& account, const std::string& url) = 0;

    /// TXT record value for a dns-01 token under this account's key
    virtual std::string dnsTxtValue(const domain::models::AcmeRegistration& account,
                                    const std::string& token) = 0;

    /// Tell the server the challenge is ready for validation
    virtual void answerChallenge(const domain::models::AcmeRegistration& account,
                                 const domain::models::AcmeChallenge& challenge) = 0;

    /**
     * @brief Wait for authorizations, submit the CSR and download the chain
     * @throws common::TimeoutException when @p timeout elapses first
     * @throws common::ProtocolException on an invalid authorization or order
     */
    virtual domain::models::FinalOrder pollAndFinalize(const domain::models::AcmeRegistration& account,
                                                       const domain::models::AcmeOrder& order,
                                                       const std::string& csrPem,
                                                       std::chrono::seconds timeout) = 0;

    virtual void revokeCertificate(const domain::models::AcmeRegistration& account,
                                   const std::string& certificatePem, int reason) = 0;
};

/**
 * @brief IAcmeClient over an IHttpTransport
 *
 * Replay nonces are pooled per newNonce endpoint and shared between
 * threads, so concurrent authorizations can use one client.
 */
class AcmeClient : public IAcmeClient {
public:
    /**
     * @param transport Non-owning
     * @param pollInterval Delay between status polls
     * @throws std::invalid_argument if transport is nullptr
     */
    explicit AcmeClient(IHttpTransport* transport,
                        std::chrono::milliseconds pollInterval = std::chrono::seconds(3));

    domain::models::AcmeDirectory fetchDirectory(const std::string& directoryUri) override;
    std::string registerAccount(const domain::models::AcmeDirectory& directory,
                                const std::string& accountKeyPem, bool termsAgreed) override;
    domain::models::AcmeOrder newOrder(const domain::models::AcmeRegistration& account,
                                       const std::vector<std::string>& domains) override;
    domain::models::AcmeAuthorization fetchAuthorization(const domain::models::AcmeRegistration& account,
                                                         const std::string& url) override;
    std::string dnsTxtValue(const domain::models::AcmeRegistration& account,
                            const std::string& token) override;
    void answerChallenge(const domain::models::AcmeRegistration& account,
                         const domain::models::AcmeChallenge& challenge) override;
    domain::models::FinalOrder pollAndFinalize(const domain::models::AcmeRegistration& account,
                                               const domain::models::AcmeOrder& order,
                                               const std::string& csrPem,
                                               std::chrono::seconds timeout) override;
    void revokeCertificate(const domain::models::AcmeRegistration& account,
                           const std::string& certificatePem, int reason) override;

private:
    std::string takeNonce(const std::string& newNonceUri);
    void keepNonce(const std::string& newNonceUri, const HttpResponse& response);

    /**
     * @brief Signed POST; retried once when the server rejects the nonce
     * @throws common::ProtocolException for HTTP statuses >= 400
     */
    HttpResponse signedPost(const JwsSigner& signer, const std::string& newNonceUri,
                            const std::string& url, const std::string& payload,
                            const std::optional<std::string>& kid);

    /// POST-as-GET with the account kid
    HttpResponse postAsGet(const domain::models::AcmeRegistration& account, const std::string& url);

    domain::models::AcmeOrder parseOrder(const std::string& uri, const std::string& body) const;

    IHttpTransport* transport_;
    std::chrono::milliseconds pollInterval_;

    std::mutex nonceMutex_;
    std::map<std::string, std::vector<std::string>> nonces_;
};

} // namespace adapters
