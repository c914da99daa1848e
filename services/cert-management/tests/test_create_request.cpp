/**
 * @file test_create_request.cpp
 * @brief JSON request parsing into the creation variants
 */

#include <gtest/gtest.h>

#include "../src/domain/models/create_request.h"
#include "exceptions.h"

#include <json/json.h>
#include <memory>
#include <stdexcept>

using namespace domain::models;

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        throw std::runtime_error("bad test JSON: " + errs);
    }
    return root;
}

Json::Value internalRequest() {
    return parse(R"({
        "create_type": "CERTIFICATE_CREATE_INTERNAL",
        "name": "web",
        "country": "US", "state": "Tennessee", "city": "Maryville",
        "organization": "Example", "common": "www.example.com",
        "email": "admin@example.com",
        "san": ["www.example.com", "10.0.0.1"],
        "key_length": 2048, "digest_algorithm": "SHA256",
        "lifetime": 825, "signedby": 3
    })");
}

} // anonymous namespace

TEST(CreateRequestParsing, InternalCertificate) {
    auto request = parseCertificateCreateRequest(internalRequest());

    ASSERT_TRUE(std::holds_alternative<CreateInternalCertificate>(request));
    const auto& r = std::get<CreateInternalCertificate>(request);
    EXPECT_EQ(r.name, "web");
    EXPECT_EQ(*r.subject.common, "www.example.com");
    EXPECT_FALSE(r.subject.organizationalUnit.has_value());
    EXPECT_EQ(r.subject.san.size(), 2u);
    EXPECT_EQ(r.keyLength, 2048);
    EXPECT_EQ(r.signedby, 3);
    EXPECT_EQ(requestName(request), "web");

    auto attrs = commonAttributes(request);
    EXPECT_EQ(*attrs.country, "US");
    EXPECT_EQ(*attrs.signedby, 3);
    EXPECT_FALSE(attrs.certificate.has_value());
}

TEST(CreateRequestParsing, AcmeWithStringIdsAndDefaults) {
    auto request = parseCertificateCreateRequest(parse(R"({
        "create_type": "CERTIFICATE_CREATE_ACME",
        "name": "acme-web",
        "csr_id": "4",
        "acme_directory_uri": "https://acme.test/directory",
        "dns_mapping": {"a.example.com": 1, "*.b.example.com": "2"}
    })"));

    const auto& r = std::get<CreateAcmeCertificate>(request);
    EXPECT_EQ(r.csrId, 4);
    EXPECT_EQ(r.dnsMapping.at("*.b.example.com"), 2);
    EXPECT_FALSE(r.tos);
    EXPECT_EQ(r.renewDays, 10);
}

TEST(CreateRequestParsing, ImportedCsrReadsUppercaseKey) {
    auto request = parseCertificateCreateRequest(parse(R"({
        "create_type": "CERTIFICATE_CREATE_IMPORTED_CSR",
        "name": "imported", "CSR": "csr-pem", "privatekey": "key-pem"
    })"));

    const auto& r = std::get<ImportCsr>(request);
    EXPECT_EQ(r.csr, "csr-pem");
    EXPECT_FALSE(r.passphrase.has_value());
}

TEST(CreateRequestParsing, UnknownCreateType) {
    try {
        parseCertificateCreateRequest(parse(R"({"create_type": "CERTIFICATE_CREATE_MAGIC", "name": "x"})"));
        FAIL() << "expected ValidationException";
    } catch (const common::ValidationException& e) {
        ASSERT_EQ(e.errors().size(), 1u);
        EXPECT_EQ(e.errors()[0].field, "certificate_create.create_type");
        EXPECT_EQ(e.errors()[0].message, "Invalid choice: CERTIFICATE_CREATE_MAGIC");
    }
}

TEST(CreateRequestParsing, MissingFieldsReportedTogether) {
    Json::Value json = internalRequest();
    json.removeMember("common");
    json.removeMember("lifetime");

    try {
        parseCertificateCreateRequest(json);
        FAIL() << "expected ValidationException";
    } catch (const common::ValidationException& e) {
        EXPECT_EQ(e.errors().size(), 2u);
        EXPECT_TRUE(e.contains("certificate_create.common"));
        EXPECT_TRUE(e.contains("certificate_create.lifetime"));
        EXPECT_EQ(e.errors()[0].message, "This field is required");
    }
}

TEST(CreateRequestParsing, UnsupportedDigestRejected) {
    Json::Value json = internalRequest();
    json["digest_algorithm"] = "MD5";

    try {
        parseCertificateCreateRequest(json);
        FAIL() << "expected ValidationException";
    } catch (const common::ValidationException& e) {
        ASSERT_EQ(e.errors().size(), 1u);
        EXPECT_EQ(e.errors()[0].field, "certificate_create.digest_algorithm");
        EXPECT_EQ(e.errors()[0].message, "Invalid choice: MD5");
    }
}

TEST(CreateRequestParsing, RenewDaysBelowOneRejected) {
    auto json = parse(R"({
        "create_type": "CERTIFICATE_CREATE_ACME", "name": "a", "csr_id": 1,
        "acme_directory_uri": "https://acme.test/directory", "renew_days": 0
    })");
    EXPECT_THROW(parseCertificateCreateRequest(json), common::ValidationException);
}

TEST(CreateRequestParsing, IntermediateCaNeedsSigner) {
    Json::Value json = internalRequest();
    json["create_type"] = "CA_CREATE_INTERMEDIATE";
    json.removeMember("signedby");

    try {
        parseCaCreateRequest(json);
        FAIL() << "expected ValidationException";
    } catch (const common::ValidationException& e) {
        EXPECT_TRUE(e.contains("certificate_authority_create.signedby"));
    }

    json["signedby"] = 9;
    auto request = parseCaCreateRequest(json);
    EXPECT_EQ(std::get<CreateIntermediateCa>(request).signedby, 9);
}

TEST(CreateRequestParsing, CaUpdateOnlyAcceptsSignCsr) {
    auto update = parseCaUpdateRequest(parse(R"({"create_type": "CA_SIGN_CSR", "csr_cert_id": 5, "name": "s"})"));
    EXPECT_EQ(*update.csrCertId, 5);

    EXPECT_THROW(parseCaUpdateRequest(parse(R"({"create_type": "CA_CREATE_INTERNAL"})")),
                 common::ValidationException);
}
