/**
 * @file nonce_repository.cpp
 * @brief NonceRepository implementation
 */

#include "nonce_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

NonceRepository::NonceRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("NonceRepository: queryExecutor cannot be nullptr");
    }
}

void NonceRepository::insert(const std::string& value, std::time_t issuedAt) {
    try {
        const char* query = "INSERT INTO acme_nonce (value, issued_at) VALUES ($1, $2)";
        queryExecutor_->executeCommand(query, {value, std::to_string(issuedAt)});
    } catch (const std::exception& e) {
        spdlog::error("[NonceRepository] Insert failed: {}", e.what());
        throw;
    }
}

bool NonceRepository::consume(const std::string& value, std::time_t notBefore) {
    if (value.empty()) {
        return false;
    }

    try {
        const char* query = "DELETE FROM acme_nonce WHERE value = $1 RETURNING issued_at";
        Json::Value rows = queryExecutor_->executeQuery(query, {value});
        if (rows.empty()) {
            return false;
        }
        return common::db::getInt64(rows[0], "issued_at") >= notBefore;
    } catch (const std::exception& e) {
        spdlog::error("[NonceRepository] Consume failed: {}", e.what());
        throw;
    }
}

int NonceRepository::deleteIssuedBefore(std::time_t cutoff) {
    try {
        const char* query = "DELETE FROM acme_nonce WHERE issued_at < $1";
        return queryExecutor_->executeCommand(query, {std::to_string(cutoff)});
    } catch (const std::exception& e) {
        spdlog::error("[NonceRepository] Cleanup failed: {}", e.what());
        throw;
    }
}

} // namespace repositories
