/**
 * @file authorization_repository.cpp
 * @brief AuthorizationRepository and ChallengeRepository implementation
 */

#include "authorization_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using namespace domain::models;

// =============================================================================
// AuthorizationRepository
// =============================================================================

AuthorizationRepository::AuthorizationRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("AuthorizationRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<Authorization> AuthorizationRepository::findById(const std::string& id) {
    try {
        const char* query =
            "SELECT id, order_id, identifier, status, expires_at FROM acme_authorization WHERE id = $1";

        Json::Value rows = queryExecutor_->executeQuery(query, {id});
        if (rows.empty()) {
            return std::nullopt;
        }
        return rowToAuthorization(rows[0]);
    } catch (const std::exception& e) {
        spdlog::error("[AuthorizationRepository] Find by ID failed: {}", e.what());
        throw;
    }
}

std::vector<Authorization> AuthorizationRepository::findByOrder(const std::string& orderId) {
    try {
        const char* query = R"SQL(
            SELECT id, order_id, identifier, status, expires_at
            FROM acme_authorization
            WHERE order_id = $1
            ORDER BY identifier
        )SQL";

        std::vector<Authorization> result;
        for (const auto& row : queryExecutor_->executeQuery(query, {orderId})) {
            result.push_back(rowToAuthorization(row));
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("[AuthorizationRepository] Find by order failed: {}", e.what());
        throw;
    }
}

bool AuthorizationRepository::transition(
    const std::string& id, AuthorizationStatus from, AuthorizationStatus to)
{
    try {
        const char* query =
            "UPDATE acme_authorization SET status = $3 WHERE id = $1 AND status = $2";
        return queryExecutor_->executeCommand(query, {
            id, authorizationStatusToString(from), authorizationStatusToString(to)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[AuthorizationRepository] Transition failed: {}", e.what());
        throw;
    }
}

Authorization AuthorizationRepository::rowToAuthorization(const Json::Value& row) {
    Authorization authz;
    authz.id = common::db::getString(row, "id");
    authz.orderId = common::db::getString(row, "order_id");
    authz.identifier = common::db::getString(row, "identifier");
    authz.status = authorizationStatusFromString(common::db::getString(row, "status"));
    authz.expiresAt = static_cast<std::time_t>(common::db::getInt64(row, "expires_at"));
    return authz;
}

// =============================================================================
// ChallengeRepository
// =============================================================================

ChallengeRepository::ChallengeRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("ChallengeRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<Challenge> ChallengeRepository::findById(const std::string& id) {
    try {
        const char* query = R"SQL(
            SELECT id, authorization_id, type, token, status, validated_at, attempts, error
            FROM acme_challenge
            WHERE id = $1
        )SQL";

        Json::Value rows = queryExecutor_->executeQuery(query, {id});
        if (rows.empty()) {
            return std::nullopt;
        }
        return rowToChallenge(rows[0]);
    } catch (const std::exception& e) {
        spdlog::error("[ChallengeRepository] Find by ID failed: {}", e.what());
        throw;
    }
}

std::vector<Challenge> ChallengeRepository::findByAuthorization(const std::string& authorizationId) {
    try {
        const char* query = R"SQL(
            SELECT id, authorization_id, type, token, status, validated_at, attempts, error
            FROM acme_challenge
            WHERE authorization_id = $1
            ORDER BY type
        )SQL";

        std::vector<Challenge> result;
        for (const auto& row : queryExecutor_->executeQuery(query, {authorizationId})) {
            result.push_back(rowToChallenge(row));
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("[ChallengeRepository] Find by authorization failed: {}", e.what());
        throw;
    }
}

bool ChallengeRepository::startProcessing(const std::string& id) {
    try {
        const char* query = R"SQL(
            UPDATE acme_challenge AS c SET status = 'processing'
            WHERE c.id = $1 AND c.status = 'pending'
              AND NOT EXISTS (
                  SELECT 1 FROM acme_challenge AS s
                  WHERE s.authorization_id = c.authorization_id
                    AND s.id <> c.id
                    AND s.status IN ('processing', 'valid')
              )
        )SQL";
        return queryExecutor_->executeCommand(query, {id}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[ChallengeRepository] Start processing failed: {}", e.what());
        throw;
    }
}

bool ChallengeRepository::recordAttempt(const std::string& id, int attempts, const Json::Value& error) {
    try {
        const char* query = R"SQL(
            UPDATE acme_challenge SET attempts = $2, error = $3
            WHERE id = $1 AND status = 'processing'
        )SQL";
        return queryExecutor_->executeCommand(query, {
            id, std::to_string(attempts), common::db::toJsonText(error)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[ChallengeRepository] Record attempt failed: {}", e.what());
        throw;
    }
}

bool ChallengeRepository::markValid(const std::string& id, std::time_t validatedAt) {
    try {
        const char* query = R"SQL(
            UPDATE acme_challenge SET status = 'valid', validated_at = $2, error = NULL
            WHERE id = $1 AND status = 'processing'
        )SQL";
        return queryExecutor_->executeCommand(query, {id, std::to_string(validatedAt)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[ChallengeRepository] Mark valid failed: {}", e.what());
        throw;
    }
}

bool ChallengeRepository::markInvalid(const std::string& id, const Json::Value& error) {
    try {
        const char* query = R"SQL(
            UPDATE acme_challenge SET status = 'invalid', error = $2
            WHERE id = $1 AND status = 'processing'
        )SQL";
        return queryExecutor_->executeCommand(query, {id, common::db::toJsonText(error)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[ChallengeRepository] Mark invalid failed: {}", e.what());
        throw;
    }
}

Challenge ChallengeRepository::rowToChallenge(const Json::Value& row) {
    Challenge challenge;
    challenge.id = common::db::getString(row, "id");
    challenge.authorizationId = common::db::getString(row, "authorization_id");
    challenge.type = challengeTypeFromString(common::db::getString(row, "type"));
    challenge.token = common::db::getString(row, "token");
    challenge.status = challengeStatusFromString(common::db::getString(row, "status"));
    if (auto validated = common::db::getOptionalInt64(row, "validated_at")) {
        challenge.validatedAt = static_cast<std::time_t>(*validated);
    }
    challenge.attempts = common::db::getInt(row, "attempts");
    challenge.error = common::db::parseJsonText(row, "error");
    return challenge;
}

} // namespace repositories
