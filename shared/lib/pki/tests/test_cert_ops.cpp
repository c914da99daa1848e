/**
 * @file test_cert_ops.cpp
 * @brief Unit tests for read-only X.509 operations
 */

#include <gtest/gtest.h>
#include <certmgr/pki/cert_ops.h>
#include <regex>
#include "test_helpers.h"

using namespace certmgr::pki;

class CertOpsTest : public ::testing::Test {
protected:
    test_helpers::UniqueKey rootKey_;
    test_helpers::UniqueKey leafKey_;
    test_helpers::UniqueCert root_;
    test_helpers::UniqueCert leaf_;

    void SetUp() override {
        rootKey_ = test_helpers::generateRsaKey(2048);
        leafKey_ = test_helpers::generateRsaKey(2048);
        root_ = test_helpers::createRootCa(rootKey_.get(), "Root", 1);
        leaf_ = test_helpers::createLeaf(leafKey_.get(), rootKey_.get(), root_.get(),
                                         "www.example.com", 42, 30,
                                         "DNS:www.example.com, IP:10.0.0.1");
    }
};

// ============================================================================
// Subject
// ============================================================================

TEST_F(CertOpsTest, SubjectDn_OnelineFormat) {
    EXPECT_EQ(getSubjectDn(root_.get()), "/C=US/O=Test CA/CN=Root");
    EXPECT_EQ(getSubjectDn(nullptr), "");
}

TEST_F(CertOpsTest, SubjectFields_AllAttributesAndSan) {
    SubjectFields fields = getSubjectFields(leaf_.get());
    EXPECT_EQ(fields.country, "US");
    EXPECT_EQ(fields.state, "Tennessee");
    EXPECT_EQ(fields.city, "Maryville");
    EXPECT_EQ(fields.organization, "Example");
    EXPECT_FALSE(fields.organizationalUnit.has_value());
    EXPECT_EQ(fields.commonName, "www.example.com");
    EXPECT_EQ(fields.email, "admin@example.com");
    ASSERT_EQ(fields.san.size(), 2u);
    EXPECT_EQ(fields.san[0], "www.example.com");
    EXPECT_EQ(fields.san[1], "10.0.0.1");
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(CertOpsTest, CertificateInfo_SerialAndDigest) {
    CertificateInfo info = getCertificateInfo(leaf_.get());
    EXPECT_EQ(info.serial, 42);
    EXPECT_EQ(info.digestAlgorithm, "SHA256");
    EXPECT_EQ(info.subject.commonName, "www.example.com");
}

// ============================================================================
// Validity
// ============================================================================

TEST_F(CertOpsTest, NotAfter_CtimeFormat) {
    static const std::regex ctimeLike(R"(^[A-Z][a-z]{2} [A-Z][a-z]{2} [ 0-9]\d \d{2}:\d{2}:\d{2} \d{4}$)");
    auto notBefore = getNotBefore(leaf_.get());
    auto notAfter = getNotAfter(leaf_.get());
    ASSERT_TRUE(notBefore.has_value());
    ASSERT_TRUE(notAfter.has_value());
    EXPECT_TRUE(std::regex_match(*notBefore, ctimeLike)) << *notBefore;
    EXPECT_TRUE(std::regex_match(*notAfter, ctimeLike)) << *notAfter;
}

TEST_F(CertOpsTest, FormatCtime_KnownInstant) {
    ASN1_TIME* t = ASN1_TIME_new();
    ASN1_TIME_set_string(t, "20260105100000Z");
    auto formatted = formatCtime(t);
    ASSERT_TRUE(formatted.has_value());
    EXPECT_EQ(*formatted, "Mon Jan  5 10:00:00 2026");
    ASN1_TIME_free(t);
}

TEST_F(CertOpsTest, FormatCtime_UnconvertibleIsNullopt) {
    EXPECT_FALSE(formatCtime(nullptr).has_value());
    EXPECT_FALSE(getNotBefore(nullptr).has_value());
    EXPECT_FALSE(getNotAfter(nullptr).has_value());

    ASN1_UTCTIME* t = ASN1_UTCTIME_new();
    ASSERT_EQ(ASN1_STRING_set(t, "not-a-time", 10), 1);
    EXPECT_FALSE(formatCtime(t).has_value());
    ASN1_UTCTIME_free(t);
}

TEST_F(CertOpsTest, DaysUntilExpiry_Future) {
    auto days = daysUntilExpiry(leaf_.get());
    ASSERT_TRUE(days.has_value());
    // 30 days, less whatever elapsed since the certificate was built
    EXPECT_GE(*days, 29);
    EXPECT_LE(*days, 30);
}

TEST_F(CertOpsTest, DaysUntilExpiry_Expired) {
    auto key = test_helpers::generateRsaKey(2048);
    auto expired = test_helpers::createLeaf(key.get(), rootKey_.get(), root_.get(), "old", 7, 0);
    ASN1_TIME_set(X509_getm_notAfter(expired.get()), time(nullptr) - 3600);

    auto days = daysUntilExpiry(expired.get());
    ASSERT_TRUE(days.has_value());
    EXPECT_EQ(*days, -1);
}

// ============================================================================
// Fingerprint / key matching
// ============================================================================

TEST_F(CertOpsTest, Sha1Fingerprint_ColonSeparatedUpperHex) {
    std::string fp = getSha1Fingerprint(root_.get());
    static const std::regex pattern("^([0-9A-F]{2}:){19}[0-9A-F]{2}$");
    EXPECT_TRUE(std::regex_match(fp, pattern)) << fp;
    EXPECT_EQ(fp, getSha1Fingerprint(root_.get()));
}

TEST_F(CertOpsTest, KeyMatch_CorrectAndWrongKey) {
    EXPECT_TRUE(keyMatchesCertificate(leaf_.get(), leafKey_.get()));
    EXPECT_FALSE(keyMatchesCertificate(leaf_.get(), rootKey_.get()));
    EXPECT_FALSE(keyMatchesCertificate(nullptr, leafKey_.get()));
}
