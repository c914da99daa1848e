/**
 * @file test_attribute_validator.cpp
 * @brief Unit tests for name and common attribute validation
 */

#include <gtest/gtest.h>
#include "../src/services/attribute_validator.h"
#include "test_support.h"

using domain::models::CertificateRecord;
using domain::models::CommonAttributes;

class AttributeValidatorTest : public ::testing::Test {
protected:
    test_support::InMemoryCertificateRepository certificates_;
    test_support::InMemoryCertificateRepository authorities_;
    services::AttributeValidator validator_{&certificates_, &authorities_};
    common::ValidationErrors errors_;

    bool hasMessage(const std::string& field, const std::string& message) const {
        for (const auto& e : errors_.errors()) {
            if (e.field == field && e.message == message) return true;
        }
        return false;
    }
};

// ============================================================================
// Names
// ============================================================================

TEST_F(AttributeValidatorTest, Name_ValidAndUnused_NoErrors) {
    validator_.validateName("certificate_create", "web_server-01", errors_);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(AttributeValidatorTest, Name_ReservedKeyword_RejectedInEitherStore) {
    validator_.validateName("certificate_create", "external", errors_);
    EXPECT_TRUE(hasMessage("certificate_create.name",
                           "external is a reserved internal keyword for Certificate Management"));

    common::ValidationErrors caErrors;
    validator_.validateName("certificate_authority_create", "self-signed", caErrors);
    EXPECT_TRUE(caErrors.contains("certificate_authority_create.name"));
}

TEST_F(AttributeValidatorTest, Name_UsedByCaBlocksCertificate) {
    CertificateRecord ca;
    ca.name = "shared";
    authorities_.insert(ca);

    validator_.validateName("certificate_create", "shared", errors_);
    EXPECT_TRUE(hasMessage("certificate_create.name", "A certificate with this name already exists"));
}

TEST_F(AttributeValidatorTest, Name_UsedByCertificateBlocksCa) {
    CertificateRecord cert;
    cert.name = "shared";
    certificates_.insert(cert);

    validator_.validateName("certificate_authority_create", "shared", errors_);
    EXPECT_TRUE(errors_.contains("certificate_authority_create.name"));
}

TEST_F(AttributeValidatorTest, Name_InvalidCharacters) {
    validator_.validateName("certificate_create", "bad name!", errors_);
    EXPECT_TRUE(hasMessage("certificate_create.name", "Use alphanumeric characters, \"_\" and \"-\"."));
}

// ============================================================================
// Common attributes
// ============================================================================

TEST_F(AttributeValidatorTest, Country_MustBeIsoAlpha2) {
    CommonAttributes attrs;
    attrs.country = "XX";
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    EXPECT_TRUE(hasMessage("certificate_create.country",
                           "Please provide a valid ISO 3166-1 alpha-2 country code"));

    common::ValidationErrors ok;
    attrs.country = "US";
    validator_.validateCommonAttributes("certificate_create", attrs, ok);
    EXPECT_TRUE(ok.empty());
}

TEST_F(AttributeValidatorTest, KeyLength_OnlyKnownSizes) {
    CommonAttributes attrs;
    attrs.keyLength = 3072;
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    EXPECT_TRUE(errors_.contains("certificate_create.key_length"));
}

TEST_F(AttributeValidatorTest, Certificate_NotPem) {
    CommonAttributes attrs;
    attrs.certificate = "garbage";
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    EXPECT_TRUE(hasMessage("certificate_create.certificate", "Not a valid certificate"));
}

TEST_F(AttributeValidatorTest, Signedby_CaWithoutKey_Rejected) {
    CertificateRecord ca;
    ca.name = "nokey";
    ca.certificate = "-----BEGIN CERTIFICATE-----\n";
    int64_t id = authorities_.insert(ca);

    CommonAttributes attrs;
    attrs.signedby = id;
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    EXPECT_TRUE(hasMessage("certificate_create.signedby", "Please provide a valid signing authority"));
}

TEST_F(AttributeValidatorTest, CsrId_RecordWithoutCsr_Rejected) {
    CertificateRecord cert;
    cert.name = "plain";
    int64_t id = certificates_.insert(cert);

    CommonAttributes attrs;
    attrs.csrId = id;
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    EXPECT_TRUE(errors_.contains("certificate_create.csr_id"));
}

TEST_F(AttributeValidatorTest, KeyMismatch_Reported) {
    auto ca = test_support::makeRootCa("root", 1);
    auto other = test_support::makeRootCa("other", 1);

    CommonAttributes attrs;
    attrs.certificate = ca.certificate;
    attrs.privatekey = other.privatekey;
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    EXPECT_TRUE(hasMessage("certificate_create.privatekey",
                           "Private key does not match certificate: key values mismatch"));
}

TEST_F(AttributeValidatorTest, KeyMatch_NoErrors) {
    auto ca = test_support::makeRootCa("root", 1);

    CommonAttributes attrs;
    attrs.certificate = ca.certificate;
    attrs.privatekey = ca.privatekey;
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(AttributeValidatorTest, ErrorsAreBatched) {
    CommonAttributes attrs;
    attrs.country = "ZZ";
    attrs.keyLength = 512;
    attrs.csr = "not a csr";
    validator_.validateCommonAttributes("certificate_create", attrs, errors_);
    validator_.validateName("certificate_create", "external", errors_);

    EXPECT_EQ(errors_.size(), 4u);
    EXPECT_THROW(errors_.throwIfAny(), common::ValidationException);
}
