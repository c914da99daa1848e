/**
 * @file test_bootstrap_certificate.cpp
 * @brief Serving certificate provisioning at startup
 */

#include <gtest/gtest.h>
#include "../src/services/bootstrap_certificate.h"
#include "test_support.h"

using namespace test_support;

class BootstrapCertificateTest : public ::testing::Test {
protected:
    InMemoryCertificateRepository certificates_;
    InMemorySystemSettingsRepository settings_;
    RecordingRestartHook restartHook_;
    services::BootstrapCertificate bootstrap_{&certificates_, &settings_, &restartHook_, "certmgr_default"};
};

TEST_F(BootstrapCertificateTest, CreatesSelfSignedDefault) {
    auto id = bootstrap_.ensure();

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(settings_.uiCertificateId, id);
    EXPECT_EQ(restartHook_.count(), 1u);

    auto record = certificates_.findById(*id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "certmgr_default");
    EXPECT_EQ(record->type, domain::models::cert_type::CERT_EXISTING);
    EXPECT_EQ(*record->common, "localhost");
    EXPECT_EQ(*record->serial, 1);
    EXPECT_TRUE(record->hasPrivateKey());
    EXPECT_FALSE(record->chain);
}

TEST_F(BootstrapCertificateTest, ReusesCertificateWithDefaultName) {
    auto existing = makeCsrRecord("certmgr_default", "host.example.com");
    existing.certificate = makeLeafPem("host.example.com", 30);
    int64_t existingId = certificates_.insert(existing);

    auto id = bootstrap_.ensure();

    EXPECT_EQ(id, existingId);
    EXPECT_EQ(certificates_.size(), 1u);
    EXPECT_EQ(settings_.uiCertificateId, existingId);
}

TEST_F(BootstrapCertificateTest, KeepsPresentServingCertificate) {
    int64_t servingId = certificates_.insert(makeCsrRecord("serving", "ui.example.com"));
    settings_.uiCertificateId = servingId;

    auto id = bootstrap_.ensure();

    EXPECT_EQ(id, servingId);
    EXPECT_EQ(certificates_.size(), 1u);
    EXPECT_EQ(restartHook_.count(), 0u);
}

TEST_F(BootstrapCertificateTest, DanglingServingIdReplaced) {
    settings_.uiCertificateId = 42;

    auto id = bootstrap_.ensure();

    ASSERT_TRUE(id.has_value());
    EXPECT_NE(*id, 42);
    EXPECT_EQ(settings_.uiCertificateId, id);
}
