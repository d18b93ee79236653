/**
 * @file account_repository.h
 * @brief PostgreSQL repository for ACME accounts
 */

#pragma once

#include "repository_interfaces.h"
#include "i_query_executor.h"

namespace repositories {

/**
 * @brief Account repository (acme_account table)
 *
 * The UNIQUE constraint on thumbprint makes registration idempotent:
 * concurrent registrations with one key produce a single row.
 */
class AccountRepository : public IAccountRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit AccountRepository(common::IQueryExecutor* queryExecutor);
    ~AccountRepository() override = default;

    AccountRepository(const AccountRepository&) = delete;
    AccountRepository& operator=(const AccountRepository&) = delete;

    std::optional<Account> findById(const std::string& id) override;
    std::optional<Account> findByThumbprint(const std::string& thumbprint) override;
    std::pair<Account, bool> insertIfAbsent(const Account& account) override;
    bool updateContacts(const std::string& id, const std::vector<std::string>& contacts) override;
    bool updateStatus(const std::string& id, AccountStatus from, AccountStatus to) override;
    bool updateKey(
        const std::string& id,
        const std::string& oldThumbprint,
        const Json::Value& newJwk,
        const std::string& newThumbprint) override;

private:
    common::IQueryExecutor* queryExecutor_;

    std::optional<Account> findOne(const char* whereColumn, const std::string& value);
    static Account rowToAccount(const Json::Value& row);
};

} // namespace repositories
