/**
 * @file account_repository.cpp
 * @brief AccountRepository implementation
 */

#include "account_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::accountStatusFromString;
using domain::models::accountStatusToString;

AccountRepository::AccountRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("AccountRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<Account> AccountRepository::findById(const std::string& id) {
    return findOne("id", id);
}

std::optional<Account> AccountRepository::findByThumbprint(const std::string& thumbprint) {
    return findOne("thumbprint", thumbprint);
}

std::optional<Account> AccountRepository::findOne(const char* whereColumn, const std::string& value) {
    try {
        std::string query =
            "SELECT id, jwk, thumbprint, status, contacts, terms_of_service_agreed, created_at "
            "FROM acme_account WHERE " + std::string(whereColumn) + " = $1";

        Json::Value rows = queryExecutor_->executeQuery(query, {value});
        if (rows.empty()) {
            return std::nullopt;
        }
        return rowToAccount(rows[0]);
    } catch (const std::exception& e) {
        spdlog::error("[AccountRepository] Find by {} failed: {}", whereColumn, e.what());
        throw;
    }
}

std::pair<Account, bool> AccountRepository::insertIfAbsent(const Account& account) {
    try {
        const char* query = R"SQL(
            INSERT INTO acme_account (
                id, jwk, thumbprint, status, contacts, terms_of_service_agreed, created_at
            ) VALUES ($1, $2, $3, $4, $5, $6, $7)
            ON CONFLICT (thumbprint) DO NOTHING
        )SQL";

        std::vector<std::string> params = {
            account.id,
            common::db::toJsonText(account.jwk),
            account.thumbprint,
            accountStatusToString(account.status),
            common::db::stringListToJsonText(account.contacts),
            common::db::boolParam(account.termsOfServiceAgreed),
            std::to_string(account.createdAt)
        };

        bool created = queryExecutor_->executeCommand(query, params) > 0;

        auto stored = findByThumbprint(account.thumbprint);
        if (!stored) {
            throw std::runtime_error("Account vanished after insert: " + account.thumbprint);
        }

        if (created) {
            spdlog::info("[AccountRepository] Account created: {}", stored->id);
        }
        return {*stored, created};
    } catch (const std::exception& e) {
        spdlog::error("[AccountRepository] Insert failed: {}", e.what());
        throw;
    }
}

bool AccountRepository::updateContacts(const std::string& id, const std::vector<std::string>& contacts) {
    try {
        const char* query =
            "UPDATE acme_account SET contacts = $2 WHERE id = $1 AND status = 'valid'";
        return queryExecutor_->executeCommand(query, {id, common::db::stringListToJsonText(contacts)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[AccountRepository] Update contacts failed: {}", e.what());
        throw;
    }
}

bool AccountRepository::updateStatus(const std::string& id, AccountStatus from, AccountStatus to) {
    try {
        const char* query = "UPDATE acme_account SET status = $3 WHERE id = $1 AND status = $2";
        return queryExecutor_->executeCommand(query, {
            id, accountStatusToString(from), accountStatusToString(to)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[AccountRepository] Update status failed: {}", e.what());
        throw;
    }
}

bool AccountRepository::updateKey(
    const std::string& id,
    const std::string& oldThumbprint,
    const Json::Value& newJwk,
    const std::string& newThumbprint)
{
    try {
        const char* query = R"SQL(
            UPDATE acme_account SET jwk = $3, thumbprint = $4
            WHERE id = $1 AND thumbprint = $2 AND status = 'valid'
              AND NOT EXISTS (SELECT 1 FROM acme_account WHERE thumbprint = $4)
        )SQL";

        return queryExecutor_->executeCommand(query, {
            id, oldThumbprint, common::db::toJsonText(newJwk), newThumbprint}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[AccountRepository] Key rollover failed: {}", e.what());
        throw;
    }
}

Account AccountRepository::rowToAccount(const Json::Value& row) {
    Account account;
    account.id = common::db::getString(row, "id");
    account.jwk = common::db::parseJsonText(row, "jwk");
    account.thumbprint = common::db::getString(row, "thumbprint");
    account.status = accountStatusFromString(common::db::getString(row, "status"));
    account.contacts = common::db::getStringList(row, "contacts");
    account.termsOfServiceAgreed = common::db::getBool(row, "terms_of_service_agreed");
    account.createdAt = static_cast<std::time_t>(common::db::getInt64(row, "created_at"));
    return account;
}

} // namespace repositories
