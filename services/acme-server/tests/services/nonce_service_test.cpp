/**
 * @file nonce_service_test.cpp
 * @brief Unit tests for NonceService
 *
 * Single use, expiry and concurrent consumption of anti-replay nonces
 */

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "services/nonce_service.h"
#include "repositories/memory/memory_repositories.h"
#include "../test_support.h"

namespace {

class NonceServiceTest : public ::testing::Test {
protected:
    acme_test::ManualClock clock_;
    std::shared_ptr<repositories::MemoryState> state_ = std::make_shared<repositories::MemoryState>();
    repositories::MemoryNonceRepository repository_{state_};
    std::unique_ptr<services::NonceService> service_;

    void SetUp() override {
        service_ = std::make_unique<services::NonceService>(&repository_, 600, clock_.clock());
    }
};

// --- Issue Tests ---

TEST_F(NonceServiceTest, IssuedNoncesAreDistinctBase64Url) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string nonce = service_->issue();
        EXPECT_EQ(nonce.find_first_not_of(
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"), std::string::npos);
        EXPECT_TRUE(seen.insert(nonce).second);
    }
}

// --- Consume Tests ---

TEST_F(NonceServiceTest, NonceIsAcceptedOnce) {
    std::string nonce = service_->issue();

    EXPECT_TRUE(service_->consume(nonce));
    EXPECT_FALSE(service_->consume(nonce));
}

TEST_F(NonceServiceTest, UnknownNonceIsRejected) {
    EXPECT_FALSE(service_->consume("never-issued"));
    EXPECT_FALSE(service_->consume(""));
}

TEST_F(NonceServiceTest, ExpiredNonceIsRejected) {
    std::string nonce = service_->issue();
    clock_.advance(601);

    EXPECT_FALSE(service_->consume(nonce));
}

TEST_F(NonceServiceTest, ConcurrentConsumersAcceptExactlyOnce) {
    std::string nonce = service_->issue();
    std::atomic<int> accepted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            if (service_->consume(nonce)) ++accepted;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), 1);
}

// --- Purge Tests ---

TEST_F(NonceServiceTest, PurgeRemovesOnlyExpiredNonces) {
    service_->issue();
    service_->issue();
    clock_.advance(601);
    std::string fresh = service_->issue();

    EXPECT_EQ(service_->purgeExpired(), 2);
    EXPECT_TRUE(service_->consume(fresh));
}

} // anonymous namespace
