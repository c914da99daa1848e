/**
 * @file test_serial_allocator.cpp
 * @brief Unit tests for per-hierarchy serial allocation
 */

#include <gtest/gtest.h>
#include "../src/services/serial_allocator.h"
#include "test_support.h"

using domain::models::CertificateRecord;
namespace cert_type = domain::models::cert_type;

class SerialAllocatorTest : public ::testing::Test {
protected:
    test_support::InMemoryCertificateRepository certificates_;
    test_support::InMemoryCertificateRepository authorities_;
    services::SerialAllocator allocator_{&certificates_, &authorities_};

    int64_t addCa(const std::string& name, std::optional<int64_t> serial, std::optional<int64_t> signedby) {
        CertificateRecord ca;
        ca.name = name;
        ca.type = signedby ? cert_type::CA_INTERMEDIATE : cert_type::CA_INTERNAL;
        ca.serial = serial;
        ca.signedby = signedby;
        return authorities_.insert(ca);
    }

    int64_t addCert(const std::string& name, std::optional<int64_t> serial, int64_t signedby) {
        CertificateRecord cert;
        cert.name = name;
        cert.type = cert_type::CERT_INTERNAL;
        cert.serial = serial;
        cert.signedby = signedby;
        return certificates_.insert(cert);
    }
};

TEST_F(SerialAllocatorTest, RootWithOneLeaf_NextIsThree) {
    int64_t root = addCa("root", 1, std::nullopt);
    addCert("leaf1", 2, root);

    EXPECT_EQ(allocator_.next(root), 3);
}

TEST_F(SerialAllocatorTest, UnknownCa_StartsAtOne) {
    EXPECT_EQ(allocator_.next(42), 1);
}

TEST_F(SerialAllocatorTest, EmptyHierarchy_NullAndZeroSerialsIgnored) {
    int64_t root = addCa("root", std::nullopt, std::nullopt);
    addCert("legacy", std::nullopt, root);
    addCert("zero", 0, root);

    EXPECT_EQ(allocator_.next(root), 1);
}

TEST_F(SerialAllocatorTest, IntermediateSharesRootCounter) {
    int64_t root = addCa("root", 1, std::nullopt);
    int64_t intermediate = addCa("intermediate", 5, root);
    addCert("under-root", 3, root);
    addCert("under-intermediate", 9, intermediate);

    // Whole tree counts, whichever node asks
    EXPECT_EQ(allocator_.next(root), 10);
    EXPECT_EQ(allocator_.next(intermediate), 10);
}

TEST_F(SerialAllocatorTest, SeparateHierarchiesAreIndependent) {
    int64_t rootA = addCa("root-a", 1, std::nullopt);
    int64_t rootB = addCa("root-b", 100, std::nullopt);
    addCert("b-leaf", 150, rootB);

    EXPECT_EQ(allocator_.next(rootA), 2);
    EXPECT_EQ(allocator_.next(rootB), 151);
}

TEST_F(SerialAllocatorTest, RepeatedAllocations_StrictlyIncreasing) {
    int64_t root = addCa("root", 1, std::nullopt);
    int64_t intermediate = addCa("intermediate", 2, root);

    std::set<int64_t> seen;
    int64_t previous = 0;
    for (int i = 0; i < 6; ++i) {
        // Alternate between root and a sibling branch to interleave allocations
        int64_t issuer = (i % 2 == 0) ? root : intermediate;
        int64_t serial = allocator_.next(root);
        addCert("cert-" + std::to_string(i), allocator_.next(issuer), issuer);

        EXPECT_GT(serial, previous);
        EXPECT_TRUE(seen.insert(serial).second);
        previous = serial;
    }
}

TEST_F(SerialAllocatorTest, SigningCycle_Terminates) {
    int64_t a = addCa("a", 4, std::nullopt);
    int64_t b = addCa("b", 6, a);
    auto recordA = *authorities_.findById(a);
    recordA.signedby = b;
    authorities_.update(recordA);

    EXPECT_EQ(allocator_.next(a), 7);
}

TEST(SerialAllocatorConstruction, NullRepository_Throws) {
    test_support::InMemoryCertificateRepository repo;
    EXPECT_THROW(services::SerialAllocator(nullptr, &repo), std::invalid_argument);
    EXPECT_THROW(services::SerialAllocator(&repo, nullptr), std::invalid_argument);
}
