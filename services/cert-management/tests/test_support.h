/**
 * @file test_support.h
 * @brief In-memory repositories and scripted collaborators for service tests
 *
 * Implement the production interfaces so services run unchanged without a
 * database, ACME server or DNS provider.
 */

#pragma once

#include "../src/adapters/acme/acme_client.h"
#include "../src/adapters/acme/http_transport.h"
#include "../src/adapters/dns/dns_authenticator.h"
#include "../src/common/progress_reporter.h"
#include "../src/infrastructure/service_restart_hook.h"
#include "../src/repositories/acme_registration_repository.h"
#include "../src/repositories/certificate_repository.h"
#include "../src/repositories/dns_authenticator_repository.h"
#include "../src/repositories/system_settings_repository.h"
#include "exceptions.h"

#include <certmgr/pki/cert_builder.h>
#include <certmgr/pki/pem.h>
#include <certmgr/pki/san.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace test_support {

using domain::models::AcmeAuthorization;
using domain::models::AcmeChallenge;
using domain::models::AcmeDirectory;
using domain::models::AcmeOrder;
using domain::models::AcmeRegistration;
using domain::models::CertificateRecord;
using domain::models::DnsAuthenticator;
using domain::models::FinalOrder;

// ============================================================================
// Repositories
// ============================================================================

class InMemoryCertificateRepository : public repositories::ICertificateRepository {
public:
    std::optional<CertificateRecord> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rows_.find(id);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<CertificateRecord> findByName(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.name == name) return row;
        }
        return std::nullopt;
    }

    std::vector<CertificateRecord> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<CertificateRecord> all;
        for (const auto& [id, row] : rows_) all.push_back(row);
        return all;
    }

    std::vector<CertificateRecord> findBySignedBy(int64_t caId) override {
        std::vector<CertificateRecord> result;
        for (auto& row : findAll()) {
            if (row.signedby && *row.signedby == caId) result.push_back(row);
        }
        return result;
    }

    std::vector<CertificateRecord> findAcmeIssued() override {
        std::vector<CertificateRecord> result;
        for (auto& row : findAll()) {
            if (row.acme) result.push_back(row);
        }
        return result;
    }

    int64_t insert(const CertificateRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        CertificateRecord row = record;
        row.id = nextId_++;
        rows_[row.id] = row;
        return row.id;
    }

    void update(const CertificateRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_[record.id] = record;
    }

    bool remove(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.erase(id) > 0;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

private:
    std::mutex mutex_;
    std::map<int64_t, CertificateRecord> rows_;
    int64_t nextId_ = 1;
};

class InMemoryAcmeRegistrationRepository : public repositories::IAcmeRegistrationRepository {
public:
    std::optional<AcmeRegistration> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rows_.find(id);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<AcmeRegistration> findByDirectory(const std::string& directory) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.directory == directory) return row;
        }
        return std::nullopt;
    }

    int64_t insert(const AcmeRegistration& registration) override {
        std::lock_guard<std::mutex> lock(mutex_);
        AcmeRegistration row = registration;
        row.id = nextId_++;
        rows_[row.id] = row;
        return row.id;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

private:
    std::mutex mutex_;
    std::map<int64_t, AcmeRegistration> rows_;
    int64_t nextId_ = 1;
};

class InMemoryDnsAuthenticatorRepository : public repositories::IDnsAuthenticatorRepository {
public:
    void add(int64_t id, const std::string& name, const std::string& type) {
        DnsAuthenticator a;
        a.id = id;
        a.name = name;
        a.authenticator = type;
        rows_[id] = a;
    }

    std::optional<DnsAuthenticator> findById(int64_t id) override {
        auto it = rows_.find(id);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<DnsAuthenticator> findAll() override {
        std::vector<DnsAuthenticator> all;
        for (const auto& [id, row] : rows_) all.push_back(row);
        return all;
    }

private:
    std::map<int64_t, DnsAuthenticator> rows_;
};

class InMemorySystemSettingsRepository : public repositories::ISystemSettingsRepository {
public:
    std::optional<int64_t> getUiCertificateId() override { return uiCertificateId; }
    void setUiCertificateId(int64_t certificateId) override { uiCertificateId = certificateId; }

    std::optional<int64_t> uiCertificateId;
};

// ============================================================================
// Collaborators
// ============================================================================

class RecordingRestartHook : public infrastructure::IServiceRestartHook {
public:
    void restart(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        reasons.push_back(reason);
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return reasons.size();
    }

    std::vector<std::string> reasons;

private:
    std::mutex mutex_;
};

class RecordingProgressSink : public common::IProgressSink {
public:
    void onProgress(const std::string&, double percent, const std::string& description) override {
        std::lock_guard<std::mutex> lock(mutex_);
        percents.push_back(percent);
        descriptions.push_back(description);
    }

    bool sawDescription(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(descriptions.begin(), descriptions.end(), text) != descriptions.end();
    }

    std::vector<double> percents;
    std::vector<std::string> descriptions;

private:
    std::mutex mutex_;
};

/**
 * @brief DNS backend that records published TXT values; listed domains fail
 */
class RecordingDnsAuthenticator : public adapters::IDnsAuthenticator {
public:
    void updateTxtRecord(const DnsAuthenticator& authenticator, const std::string& domain,
                         const std::string&, const std::string& txtValue) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failingDomains.count(domain)) {
            throw common::ProtocolException("DNS update rejected for " + domain);
        }
        published[domain] = txtValue;
        usedAuthenticators[domain] = authenticator.id;
    }

    std::set<std::string> failingDomains;
    std::map<std::string, std::string> published;
    std::map<std::string, int64_t> usedAuthenticators;

private:
    std::mutex mutex_;
};

/**
 * @brief Scripted ACME server
 *
 * Every identifier of the order gets one pending dns-01 authorization at
 * "<base>/authz/<identifier>". The final chain is a caller-supplied PEM.
 */
class FakeAcmeClient : public adapters::IAcmeClient {
public:
    AcmeDirectory fetchDirectory(const std::string& directoryUri) override {
        ++directoryFetches;
        AcmeDirectory d;
        d.newAccount = directoryUri + "new-account";
        d.newNonce = directoryUri + "new-nonce";
        d.newOrder = directoryUri + "new-order";
        d.revokeCert = directoryUri + "revoke-cert";
        d.termsOfService = directoryUri + "terms";
        return d;
    }

    std::string registerAccount(const AcmeDirectory& directory, const std::string&, bool termsAgreed) override {
        ++registrations;
        lastTermsAgreed = termsAgreed;
        return directory.newAccount + "/1";
    }

    AcmeOrder newOrder(const AcmeRegistration&, const std::vector<std::string>& domains) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNewOrder) throw common::ProtocolException("rateLimited");
        orderedDomains = domains;

        AcmeOrder order;
        order.uri = "https://acme.test/order/1";
        order.status = "pending";
        order.finalizeUri = order.uri + "/finalize";
        for (const auto& domain : domains) {
            order.identifiers.push_back(domain);
            order.authorizationUris.push_back("https://acme.test/authz/" + domain);
        }
        return order;
    }

    AcmeAuthorization fetchAuthorization(const AcmeRegistration&, const std::string& url) override {
        std::string domain = url.substr(url.rfind('/') + 1);
        AcmeAuthorization authz;
        authz.url = url;
        authz.wildcard = domain.rfind("*.", 0) == 0;
        authz.identifier = authz.wildcard ? domain.substr(2) : domain;

        std::lock_guard<std::mutex> lock(mutex_);
        authz.status = validDomains.count(authz.identifier) ? "valid" : "pending";
        bool dnsOffered = noDnsChallengeDomains.count(authz.identifier) == 0;
        AcmeChallenge challenge;
        challenge.type = dnsOffered ? "dns-01" : "http-01";
        challenge.url = url + (dnsOffered ? "/dns" : "/http");
        challenge.token = "token-" + authz.identifier;
        challenge.status = "pending";
        authz.challenges.push_back(challenge);
        return authz;
    }

    std::string dnsTxtValue(const AcmeRegistration&, const std::string& token) override {
        return "txt-" + token;
    }

    void answerChallenge(const AcmeRegistration&, const AcmeChallenge& challenge) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& domain : failAnswerDomains) {
            if (challenge.url.find("/authz/" + domain + "/") != std::string::npos) {
                throw common::ProtocolException("malformed");
            }
        }
        answered.push_back(challenge.url);
    }

    FinalOrder pollAndFinalize(const AcmeRegistration&, const AcmeOrder& order, const std::string& csrPem,
                               std::chrono::seconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++finalizations;
        finalizedCsr = csrPem;
        FinalOrder result;
        result.uri = order.uri;
        result.fullchainPem = fullchain;
        return result;
    }

    void revokeCertificate(const AcmeRegistration&, const std::string& certificatePem, int reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failRevoke) throw common::ProtocolException("alreadyRevoked");
        revoked.push_back(certificatePem);
        lastRevokeReason = reason;
    }

    std::string fullchain;
    bool failNewOrder = false;
    bool failRevoke = false;
    std::set<std::string> validDomains;
    std::set<std::string> noDnsChallengeDomains;  ///< Offer only http-01 for these
    std::set<std::string> failAnswerDomains;      ///< answerChallenge() rejects these

    std::atomic<int> directoryFetches{0};
    std::atomic<int> registrations{0};
    std::atomic<int> finalizations{0};
    bool lastTermsAgreed = false;
    std::vector<std::string> orderedDomains;
    std::vector<std::string> answered;
    std::vector<std::string> revoked;
    int lastRevokeReason = -1;
    std::string finalizedCsr;

private:
    std::mutex mutex_;
};

/**
 * @brief HTTP transport replaying queued responses and recording requests
 */
class ScriptedHttpTransport : public adapters::IHttpTransport {
public:
    struct Request {
        std::string method;
        std::string url;
        std::string body;
    };

    void enqueue(long status, const std::string& body,
                 std::map<std::string, std::string> headers = {}) {
        adapters::HttpResponse r;
        r.status = status;
        r.body = body;
        r.headers = std::move(headers);
        responses_.push_back(r);
    }

    adapters::HttpResponse get(const std::string& url) override { return next("GET", url, ""); }
    adapters::HttpResponse head(const std::string& url) override { return next("HEAD", url, ""); }
    adapters::HttpResponse post(const std::string& url, const std::string& body,
                                const std::string&) override {
        return next("POST", url, body);
    }

    std::vector<Request> requests;

private:
    adapters::HttpResponse next(const std::string& method, const std::string& url, const std::string& body) {
        requests.push_back({method, url, body});
        if (responses_.empty()) {
            throw common::ProtocolException("No scripted response for " + method + " " + url);
        }
        adapters::HttpResponse r = responses_.front();
        responses_.pop_front();
        return r;
    }

    std::deque<adapters::HttpResponse> responses_;
};

// ============================================================================
// Material builders
// ============================================================================

/// Self-signed CA record of type CA_INTERNAL with the given serial
inline CertificateRecord makeRootCa(const std::string& name, int64_t serial) {
    certmgr::pki::SubjectFields subject;
    subject.country = "US";
    subject.organization = "Test";
    subject.commonName = name;

    auto key = certmgr::pki::generateRsaKey(2048);
    auto cert = certmgr::pki::createCertificate(subject, key.get(), 3650);
    certmgr::pki::setSerialNumber(cert.get(), serial);
    certmgr::pki::signCertificate(cert.get(), key.get(), "SHA256");

    CertificateRecord record;
    record.name = name;
    record.type = domain::models::cert_type::CA_INTERNAL;
    record.certificate = certmgr::pki::dumpCertificate(cert.get());
    record.privatekey = certmgr::pki::dumpPrivateKey(key.get());
    record.serial = serial;
    record.common = name;
    record.digestAlgorithm = "SHA256";
    return record;
}

/// CSR record carrying a fresh key and the given CN/SAN
inline CertificateRecord makeCsrRecord(const std::string& name, const std::string& commonName,
                                       const std::vector<std::string>& san = {}) {
    certmgr::pki::SubjectFields subject;
    subject.country = "US";
    subject.organization = "Test";
    subject.commonName = commonName;
    subject.san = san;

    auto key = certmgr::pki::generateRsaKey(2048);
    auto req = certmgr::pki::createSigningRequest(subject, key.get(), "SHA256");

    CertificateRecord record;
    record.name = name;
    record.type = domain::models::cert_type::CERT_CSR;
    record.csr = certmgr::pki::dumpCertificateRequest(req.get());
    record.privatekey = certmgr::pki::dumpPrivateKey(key.get());
    record.common = commonName;
    record.san = certmgr::pki::joinSan(san);
    return record;
}

/// Self-signed leaf PEM valid for @p days, used as a fake ACME chain
inline std::string makeLeafPem(const std::string& commonName, int days, int64_t serial = 7) {
    certmgr::pki::SubjectFields subject;
    subject.commonName = commonName;
    auto key = certmgr::pki::generateRsaKey(2048);
    auto cert = certmgr::pki::createCertificate(subject, key.get(), days);
    certmgr::pki::setSerialNumber(cert.get(), serial);
    certmgr::pki::signCertificate(cert.get(), key.get(), "SHA256");
    return certmgr::pki::dumpCertificate(cert.get());
}

} // namespace test_support
