/**
 * @file housekeeping_service_test.cpp
 * @brief Unit tests for the scheduled housekeeping jobs
 */

#include <gtest/gtest.h>

#include "common/exceptions.h"
#include "../test_support.h"

using acme_test::AcmeHarness;
using acme_test::AcmeTestClient;
using services::HousekeepingService;

namespace {

class HousekeepingServiceTest : public ::testing::Test {
protected:
    AcmeHarness harness_;
};

// --- generate-ocsp-keys Tests ---

TEST_F(HousekeepingServiceTest, FirstRunCreatesResponderKey) {
    auto result = harness_.housekeeping->generateOcspKeys();

    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.details["generation"].asInt64(), 1);

    auto key = harness_.ocspKeyRepo.findCurrent(harness_.ca->serial(), harness_.clock.now());
    ASSERT_TRUE(key.has_value());
    auto cert = acme::crypto::certificateFromPem(key->certPem);
    ASSERT_NE(cert, nullptr);
    EXPECT_EQ(X509_verify(cert.get(), harness_.caKey.get()), 1);
    EXPECT_NE(X509_get_extension_flags(cert.get()) & EXFLAG_XKUSAGE, 0u);
    EXPECT_NE(X509_get_extended_key_usage(cert.get()) & XKU_OCSP_SIGN, 0u);
}

TEST_F(HousekeepingServiceTest, RepeatedRunIsIdempotent) {
    harness_.housekeeping->generateOcspKeys();
    auto first = harness_.ocspKeyRepo.findNewest(harness_.ca->serial());

    harness_.clock.advance(3600);
    auto result = harness_.housekeeping->generateOcspKeys();

    EXPECT_FALSE(result.changed);
    auto second = harness_.ocspKeyRepo.findNewest(harness_.ca->serial());
    EXPECT_EQ(second->generation, first->generation);
    EXPECT_EQ(second->certPem, first->certPem);
}

TEST_F(HousekeepingServiceTest, RotatesWithinOverlapWindow) {
    harness_.housekeeping->generateOcspKeys();
    auto first = harness_.ocspKeyRepo.findNewest(harness_.ca->serial());

    // Newest key now expires within the one day overlap
    harness_.clock.advance(2 * 86400 + 60);
    auto result = harness_.housekeeping->generateOcspKeys();

    EXPECT_TRUE(result.changed);
    auto current = harness_.ocspKeyRepo.findCurrent(harness_.ca->serial(), harness_.clock.now());
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->generation, first->generation + 1);
    EXPECT_NE(current->serial, first->serial);
}

TEST_F(HousekeepingServiceTest, PrunesKeysExpiredBeyondOverlap) {
    harness_.housekeeping->generateOcspKeys();
    harness_.clock.advance(2 * 86400 + 60);
    harness_.housekeeping->generateOcspKeys();

    harness_.clock.advance(2 * 86400 + 10);
    auto result = harness_.housekeeping->generateOcspKeys();

    EXPECT_GE(result.details["pruned"].asInt(), 1);
    auto newest = harness_.ocspKeyRepo.findNewest(harness_.ca->serial());
    EXPECT_EQ(newest->generation, 3);
}

// --- acme-cleanup Tests ---

TEST_F(HousekeepingServiceTest, CleanupRemovesExpiredOrdersAndNonces) {
    // Arrange
    AcmeTestClient client(harness_);
    client.registerAccount();
    auto order = acme_test::parseJson(client.newOrder({"example.org"}).body);
    const std::string orderUrl = order["finalize"].asString();
    const std::string orderId = AcmeTestClient::lastSegment(orderUrl.substr(0, orderUrl.rfind('/')));
    harness_.nonceService->issue();

    harness_.clock.advance(3601);
    std::string fresh = harness_.nonceService->issue();

    // Act
    auto result = harness_.housekeeping->acmeCleanup();

    // Assert
    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.details["orders"].asInt(), 1);
    EXPECT_GE(result.details["nonces"].asInt(), 1);
    EXPECT_FALSE(harness_.orderRepo.findById(orderId).has_value());
    EXPECT_TRUE(harness_.nonceService->consume(fresh));
}

TEST_F(HousekeepingServiceTest, CleanupKeepsLiveOrders) {
    AcmeTestClient client(harness_);
    client.registerAccount();
    client.newOrder({"example.org"});

    auto result = harness_.housekeeping->acmeCleanup();

    EXPECT_EQ(result.details["orders"].asInt(), 0);
}

TEST_F(HousekeepingServiceTest, CleanupIsSkippedWhenAcmeDisabled) {
    acme_test::HarnessOptions options;
    options.acmeEnabled = false;
    AcmeHarness disabled(options);
    disabled.nonceService->issue();
    disabled.clock.advance(7200);

    auto result = disabled.housekeeping->acmeCleanup();

    EXPECT_FALSE(result.changed);
    EXPECT_TRUE(result.details["skipped"].asBool());
}

TEST_F(HousekeepingServiceTest, RevocationJobsRunWhenAcmeDisabled) {
    acme_test::HarnessOptions options;
    options.acmeEnabled = false;
    AcmeHarness disabled(options);

    EXPECT_TRUE(disabled.housekeeping->cacheCrls().changed);
    EXPECT_TRUE(disabled.housekeeping->generateOcspKeys().changed);
}

// --- Revocation Health Tests ---

TEST_F(HousekeepingServiceTest, RevocationHealthDegradedBeforeJobsRun) {
    auto health = harness_.housekeeping->revocationHealth();

    EXPECT_EQ(health["status"].asString(), "DEGRADED");
    EXPECT_TRUE(health["crl"]["stale"].asBool());
    EXPECT_FALSE(health["ocspResponder"]["available"].asBool());
}

TEST_F(HousekeepingServiceTest, RevocationHealthUpAfterJobsRun) {
    harness_.housekeeping->cacheCrls();
    harness_.housekeeping->generateOcspKeys();

    auto health = harness_.housekeeping->revocationHealth();

    EXPECT_EQ(health["status"].asString(), "UP");
    EXPECT_TRUE(health["acmeEnabled"].asBool());
    EXPECT_FALSE(health["crl"]["stale"].asBool());
    EXPECT_TRUE(health["ocspResponder"]["available"].asBool());
    EXPECT_EQ(health["ocspResponder"]["generation"].asInt64(), 1);
}

TEST_F(HousekeepingServiceTest, RevocationHealthDegradesWhenCrlPassesNextUpdate) {
    harness_.housekeeping->cacheCrls();
    harness_.housekeeping->generateOcspKeys();

    harness_.clock.advance(24 * 3600 + 1);
    auto health = harness_.housekeeping->revocationHealth();

    EXPECT_EQ(health["status"].asString(), "DEGRADED");
    EXPECT_TRUE(health["crl"]["stale"].asBool());
    EXPECT_TRUE(health["ocspResponder"]["available"].asBool());
}

// --- runJob Tests ---

TEST_F(HousekeepingServiceTest, RunJobDispatchesByName) {
    for (const auto& name : HousekeepingService::jobNames()) {
        auto result = harness_.housekeeping->runJob(name);
        EXPECT_EQ(result.job, name);
        EXPECT_EQ(result.toJson()["job"].asString(), name);
    }
}

TEST_F(HousekeepingServiceTest, RunJobRejectsUnknownName) {
    EXPECT_THROW(harness_.housekeeping->runJob("rotate-everything"), common::NotFoundException);
}

} // anonymous namespace
