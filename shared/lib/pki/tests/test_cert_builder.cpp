/**
 * @file test_cert_builder.cpp
 * @brief Unit tests for key generation, certificate and CSR construction
 */

#include <gtest/gtest.h>
#include <certmgr/pki/cert_builder.h>
#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/pem.h>
#include <openssl/x509v3.h>

using namespace certmgr::pki;

class CertBuilderTest : public ::testing::Test {
protected:
    SubjectFields subject_;

    void SetUp() override {
        subject_.country = "US";
        subject_.state = "Tennessee";
        subject_.city = "Maryville";
        subject_.organization = "iXsystems";
        subject_.commonName = "nas.example.com";
        subject_.email = "admin@example.com";
        subject_.san = {"nas.example.com", "192.168.0.10"};
    }
};

// ============================================================================
// Keys and digests
// ============================================================================

TEST_F(CertBuilderTest, GenerateRsaKey_RequestedSize) {
    auto key = generateRsaKey(1024);
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(EVP_PKEY_get_bits(key.get()), 1024);
}

TEST_F(CertBuilderTest, DigestByName_CaseInsensitive) {
    EXPECT_EQ(digestByName("SHA256"), EVP_sha256());
    EXPECT_EQ(digestByName("sha512"), EVP_sha512());
    EXPECT_THROW(digestByName("NOPE"), CryptoError);
}

// ============================================================================
// Certificates
// ============================================================================

TEST_F(CertBuilderTest, CreateCertificate_SelfSignedCa) {
    auto key = generateRsaKey(2048);
    auto cert = createCertificate(subject_, key.get(), 3650);
    addExtension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    addExtension(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
    addExtension(cert.get(), cert.get(), NID_subject_key_identifier, "hash");
    setSerialNumber(cert.get(), 1);
    signCertificate(cert.get(), key.get(), "SHA256");

    EXPECT_EQ(X509_get_version(cert.get()), 2);
    EXPECT_EQ(getSerialNumber(cert.get()), 1);
    EXPECT_EQ(getDigestAlgorithm(cert.get()), "SHA256");
    EXPECT_EQ(X509_check_ca(cert.get()), 1);
    EXPECT_TRUE(keyMatchesCertificate(cert.get(), key.get()));

    SubjectFields decoded = getSubjectFields(cert.get());
    EXPECT_EQ(decoded.commonName, "nas.example.com");
    EXPECT_EQ(decoded.san, subject_.san);
}

TEST_F(CertBuilderTest, CreateCertificate_SignedByIssuer) {
    auto caKey = generateRsaKey(2048);
    auto ca = createCertificate(subject_, caKey.get(), 3650);
    signCertificate(ca.get(), caKey.get(), "SHA256");

    SubjectFields leafSubject = subject_;
    leafSubject.commonName = "leaf";
    leafSubject.san.clear();
    auto leafKey = generateRsaKey(2048);
    auto leaf = createCertificate(leafSubject, leafKey.get(), 365);
    setIssuerName(leaf.get(), X509_get_subject_name(ca.get()));
    setSerialNumber(leaf.get(), 2);
    signCertificate(leaf.get(), caKey.get(), "SHA384");

    EXPECT_EQ(X509_verify(leaf.get(), caKey.get()), 1);
    EXPECT_EQ(getDigestAlgorithm(leaf.get()), "SHA384");
    auto days = daysUntilExpiry(leaf.get());
    ASSERT_TRUE(days.has_value());
    EXPECT_GE(*days, 364);
}

TEST_F(CertBuilderTest, AddExtension_InvalidValueThrows) {
    auto key = generateRsaKey(1024);
    auto cert = createCertificate(subject_, key.get(), 1);
    EXPECT_THROW(addExtension(cert.get(), cert.get(), NID_basic_constraints, "bogus:value"), CryptoError);
}

TEST_F(CertBuilderTest, OptionalOrganizationalUnitOmitted) {
    auto key = generateRsaKey(1024);
    auto cert = createCertificate(subject_, key.get(), 1);
    EXPECT_EQ(getSubjectDn(cert.get()).find("OU="), std::string::npos);

    subject_.organizationalUnit = "Storage";
    auto withOu = createCertificate(subject_, key.get(), 1);
    EXPECT_NE(getSubjectDn(withOu.get()).find("/OU=Storage"), std::string::npos);
}

// ============================================================================
// Signing requests
// ============================================================================

TEST_F(CertBuilderTest, CreateSigningRequest_SelfSignedWithSan) {
    auto key = generateRsaKey(2048);
    auto req = createSigningRequest(subject_, key.get(), "SHA256");
    ASSERT_NE(req, nullptr);
    EXPECT_EQ(X509_REQ_verify(req.get(), key.get()), 1);

    auto reloaded = loadCertificateRequest(dumpCertificateRequest(req.get()));
    ASSERT_NE(reloaded, nullptr);
    SubjectFields decoded = getRequestSubjectFields(reloaded.get());
    EXPECT_EQ(decoded.commonName, "nas.example.com");
    EXPECT_EQ(decoded.san, subject_.san);
    EXPECT_EQ(getRequestSubjectDn(reloaded.get()).rfind("/C=US/ST=Tennessee", 0), 0u);
}

TEST_F(CertBuilderTest, RandomSerial_In24BitRange) {
    for (int i = 0; i < 20; ++i) {
        int64_t serial = randomSerial24();
        EXPECT_GE(serial, 1);
        EXPECT_LT(serial, 1 << 24);
    }
}
