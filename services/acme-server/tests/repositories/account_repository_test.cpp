/**
 * @file account_repository_test.cpp
 * @brief Unit tests for the PostgreSQL repositories against a recording executor
 *
 * Verifies parameter binding, row mapping and the conditional statements
 * that carry the concurrency guarantees.
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "repositories/account_repository.h"
#include "repositories/authorization_repository.h"
#include "repositories/certificate_repository.h"
#include "repositories/nonce_repository.h"
#include "repositories/order_repository.h"
#include "fake_query_executor.h"

using acme_test::FakeQueryExecutor;
using domain::models::Account;
using domain::models::AccountStatus;

namespace {

class AccountRepositoryTest : public ::testing::Test {
protected:
    FakeQueryExecutor executor_;
    std::unique_ptr<repositories::AccountRepository> repository_;

    void SetUp() override {
        repository_ = std::make_unique<repositories::AccountRepository>(&executor_);
    }

    static Json::Value accountRow(const std::string& id, const std::string& thumbprint) {
        Json::Value row(Json::objectValue);
        row["id"] = id;
        row["jwk"] = "{\"crv\":\"P-256\",\"kty\":\"EC\",\"x\":\"AA\",\"y\":\"BB\"}";
        row["thumbprint"] = thumbprint;
        row["status"] = "valid";
        row["contacts"] = "[\"mailto:admin@example.org\"]";
        row["terms_of_service_agreed"] = true;
        row["created_at"] = Json::Int64(1750000000);
        Json::Value rows(Json::arrayValue);
        rows.append(row);
        return rows;
    }

    static Account testAccount() {
        Account account;
        account.id = "0b7c4a2e-5d1f-4c3a-9e8b-2f6d1a0c9e71";
        account.jwk["kty"] = "EC";
        account.thumbprint = "thumb-1";
        account.status = AccountStatus::VALID;
        account.contacts = {"mailto:admin@example.org"};
        account.termsOfServiceAgreed = true;
        account.createdAt = 1750000000;
        return account;
    }
};

// --- Constructor Tests ---

TEST_F(AccountRepositoryTest, NullExecutorThrows) {
    EXPECT_THROW(repositories::AccountRepository(nullptr), std::invalid_argument);
    EXPECT_THROW(repositories::NonceRepository(nullptr), std::invalid_argument);
}

// --- Find Tests ---

TEST_F(AccountRepositoryTest, FindByIdMapsRow) {
    // Arrange
    executor_.queryResults.push_back(accountRow("acct-1", "thumb-1"));

    // Act
    auto account = repository_->findById("acct-1");

    // Assert
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->id, "acct-1");
    EXPECT_EQ(account->thumbprint, "thumb-1");
    EXPECT_EQ(account->status, AccountStatus::VALID);
    EXPECT_EQ(account->jwk["crv"].asString(), "P-256");
    ASSERT_EQ(account->contacts.size(), 1u);
    EXPECT_EQ(account->contacts[0], "mailto:admin@example.org");
    EXPECT_TRUE(account->termsOfServiceAgreed);
    EXPECT_EQ(account->createdAt, 1750000000);
    EXPECT_NE(executor_.last().sql.find("WHERE id = $1"), std::string::npos);
    EXPECT_EQ(executor_.last().params, std::vector<std::string>{"acct-1"});
}

TEST_F(AccountRepositoryTest, FindByThumbprintMissingReturnsNullopt) {
    auto account = repository_->findByThumbprint("unknown");

    EXPECT_FALSE(account.has_value());
    EXPECT_NE(executor_.last().sql.find("WHERE thumbprint = $1"), std::string::npos);
}

TEST_F(AccountRepositoryTest, QueryFailurePropagates) {
    executor_.failNext = true;

    EXPECT_THROW(repository_->findById("acct-1"), std::runtime_error);
}

// --- Insert Tests ---

TEST_F(AccountRepositoryTest, InsertIfAbsentReportsCreation) {
    // Arrange
    executor_.commandResults.push_back(1);
    executor_.queryResults.push_back(accountRow("0b7c4a2e-5d1f-4c3a-9e8b-2f6d1a0c9e71", "thumb-1"));

    // Act
    auto result = repository_->insertIfAbsent(testAccount());

    // Assert
    EXPECT_TRUE(result.second);
    EXPECT_EQ(result.first.id, "0b7c4a2e-5d1f-4c3a-9e8b-2f6d1a0c9e71");
    const auto& insert = executor_.calls[0];
    EXPECT_NE(insert.sql.find("ON CONFLICT (thumbprint) DO NOTHING"), std::string::npos);
    ASSERT_EQ(insert.params.size(), 7u);
    EXPECT_EQ(insert.params[2], "thumb-1");
    EXPECT_EQ(insert.params[3], "valid");
    EXPECT_EQ(insert.params[4], "[\"mailto:admin@example.org\"]");
    EXPECT_EQ(insert.params[5], "true");
    EXPECT_EQ(insert.params[6], "1750000000");
}

TEST_F(AccountRepositoryTest, InsertIfAbsentReturnsExistingOnConflict) {
    executor_.commandResults.push_back(0);
    executor_.queryResults.push_back(accountRow("existing-id", "thumb-1"));

    auto result = repository_->insertIfAbsent(testAccount());

    EXPECT_FALSE(result.second);
    EXPECT_EQ(result.first.id, "existing-id");
}

TEST_F(AccountRepositoryTest, InsertIfAbsentThrowsWhenRowVanishes) {
    executor_.commandResults.push_back(0);

    EXPECT_THROW(repository_->insertIfAbsent(testAccount()), std::runtime_error);
}

// --- Update Tests ---

TEST_F(AccountRepositoryTest, UpdateStatusIsConditionalOnCurrentStatus) {
    executor_.commandResults.push_back(1);

    bool applied = repository_->updateStatus("acct-1", AccountStatus::VALID, AccountStatus::DEACTIVATED);

    EXPECT_TRUE(applied);
    EXPECT_NE(executor_.last().sql.find("AND status = $2"), std::string::npos);
    EXPECT_EQ(executor_.last().params, (std::vector<std::string>{"acct-1", "valid", "deactivated"}));
}

TEST_F(AccountRepositoryTest, UpdateKeyGuardsAgainstTakenThumbprint) {
    Json::Value jwk;
    jwk["kty"] = "OKP";

    bool applied = repository_->updateKey("acct-1", "old", jwk, "new");

    EXPECT_FALSE(applied);
    EXPECT_NE(executor_.last().sql.find("NOT EXISTS"), std::string::npos);
    ASSERT_EQ(executor_.last().params.size(), 4u);
    EXPECT_EQ(executor_.last().params[1], "old");
    EXPECT_EQ(executor_.last().params[3], "new");
}

// --- Nonce Repository Tests ---

TEST(NonceRepositoryTest, ConsumeDeletesAndChecksAge) {
    FakeQueryExecutor executor;
    repositories::NonceRepository repository(&executor);
    Json::Value rows(Json::arrayValue);
    Json::Value row;
    row["issued_at"] = Json::Int64(1000);
    rows.append(row);
    executor.queryResults.push_back(rows);
    executor.queryResults.push_back(rows);

    EXPECT_TRUE(repository.consume("n1", 900));
    EXPECT_FALSE(repository.consume("n2", 1001));
    EXPECT_FALSE(repository.consume("n3", 0));       // Not found
    EXPECT_FALSE(repository.consume("", 0));
    EXPECT_EQ(executor.calls.size(), 3u);
    EXPECT_NE(executor.calls[0].sql.find("DELETE FROM acme_nonce"), std::string::npos);
}

// --- Certificate Repository Tests ---

TEST(CertificateRepositoryTest, RevokeOnlyUpdatesUnrevokedRow) {
    FakeQueryExecutor executor;
    repositories::CertificateRepository repository(&executor);
    executor.commandResults.push_back(1);
    executor.commandResults.push_back(0);

    EXPECT_TRUE(repository.revoke("0A1B", 1, 1750000000));
    EXPECT_FALSE(repository.revoke("0A1B", 4, 1750000100));
    EXPECT_NE(executor.last().sql.find("revoked = false"), std::string::npos);
    EXPECT_EQ(executor.calls[0].params, (std::vector<std::string>{"0A1B", "1", "1750000000"}));
}

// --- Order Repository Tests ---

TEST(OrderRepositoryTest, StartProcessingRechecksAuthorizations) {
    FakeQueryExecutor executor;
    repositories::OrderRepository repository(&executor);
    executor.commandResults.push_back(0);

    EXPECT_FALSE(repository.startProcessing("order-1", 1750000000));

    const auto& call = executor.last();
    EXPECT_NE(call.sql.find("status = 'ready'"), std::string::npos);
    EXPECT_NE(call.sql.find("NOT EXISTS"), std::string::npos);
    EXPECT_NE(call.sql.find("status <> 'valid' OR expires_at <= $2"), std::string::npos);
    EXPECT_EQ(call.params, (std::vector<std::string>{"order-1", "1750000000"}));
}

// --- Challenge Repository Tests ---

TEST(ChallengeRepositoryTest, StartProcessingExcludesSelectedSibling) {
    FakeQueryExecutor executor;
    repositories::ChallengeRepository repository(&executor);
    executor.commandResults.push_back(1);

    EXPECT_TRUE(repository.startProcessing("ch-1"));

    const auto& call = executor.last();
    EXPECT_NE(call.sql.find("c.status = 'pending'"), std::string::npos);
    EXPECT_NE(call.sql.find("s.authorization_id = c.authorization_id"), std::string::npos);
    EXPECT_NE(call.sql.find("s.status IN ('processing', 'valid')"), std::string::npos);
    EXPECT_EQ(call.params, std::vector<std::string>{"ch-1"});
}

} // anonymous namespace
