/**
 * @file order_repository.cpp
 * @brief OrderRepository implementation
 */

#include "order_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::authorizationStatusToString;
using domain::models::challengeStatusToString;
using domain::models::challengeTypeToString;
using domain::models::orderStatusFromString;
using domain::models::orderStatusToString;

OrderRepository::OrderRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("OrderRepository: queryExecutor cannot be nullptr");
    }
}

void OrderRepository::createWithAuthorizations(
    const Order& order,
    const std::vector<Authorization>& authorizations,
    const std::vector<Challenge>& challenges)
{
    try {
        queryExecutor_->runInTransaction([&](common::IQueryExecutor& tx) {
            const char* orderQuery = R"SQL(
                INSERT INTO acme_order (
                    id, account_id, identifiers, status, expires_at,
                    not_before, not_after, created_at
                ) VALUES ($1, $2, $3, $4, $5, $6, $7, $8)
            )SQL";

            tx.executeCommand(orderQuery, {
                order.id,
                order.accountId,
                common::db::stringListToJsonText(order.identifiers),
                orderStatusToString(order.status),
                std::to_string(order.expiresAt),
                common::db::optionalParam(order.notBefore),
                common::db::optionalParam(order.notAfter),
                std::to_string(order.createdAt)
            });

            const char* authzQuery = R"SQL(
                INSERT INTO acme_authorization (id, order_id, identifier, status, expires_at)
                VALUES ($1, $2, $3, $4, $5)
            )SQL";

            for (const auto& authz : authorizations) {
                tx.executeCommand(authzQuery, {
                    authz.id,
                    authz.orderId,
                    authz.identifier,
                    authorizationStatusToString(authz.status),
                    std::to_string(authz.expiresAt)
                });
            }

            const char* challengeQuery = R"SQL(
                INSERT INTO acme_challenge (id, authorization_id, type, token, status, attempts)
                VALUES ($1, $2, $3, $4, $5, 0)
            )SQL";

            for (const auto& challenge : challenges) {
                tx.executeCommand(challengeQuery, {
                    challenge.id,
                    challenge.authorizationId,
                    challengeTypeToString(challenge.type),
                    challenge.token,
                    challengeStatusToString(challenge.status)
                });
            }
        });

        spdlog::info("[OrderRepository] Order created: {} ({} authorizations)",
            order.id, authorizations.size());
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Create failed: {}", e.what());
        throw;
    }
}

std::optional<Order> OrderRepository::findById(const std::string& id) {
    try {
        const char* query = R"SQL(
            SELECT id, account_id, identifiers, status, expires_at, not_before, not_after,
                   certificate_serial, error, created_at
            FROM acme_order
            WHERE id = $1
        )SQL";

        Json::Value rows = queryExecutor_->executeQuery(query, {id});
        if (rows.empty()) {
            return std::nullopt;
        }
        return rowToOrder(rows[0]);
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Find by ID failed: {}", e.what());
        throw;
    }
}

std::vector<std::string> OrderRepository::findIdsByAccount(const std::string& accountId) {
    try {
        const char* query =
            "SELECT id FROM acme_order WHERE account_id = $1 ORDER BY created_at DESC, id";

        std::vector<std::string> ids;
        for (const auto& row : queryExecutor_->executeQuery(query, {accountId})) {
            ids.push_back(common::db::getString(row, "id"));
        }
        return ids;
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Find by account failed: {}", e.what());
        throw;
    }
}

bool OrderRepository::startProcessing(const std::string& id, std::time_t now) {
    try {
        const char* query = R"SQL(
            UPDATE acme_order SET status = 'processing'
            WHERE id = $1 AND status = 'ready' AND expires_at > $2
              AND NOT EXISTS (
                  SELECT 1 FROM acme_authorization
                  WHERE order_id = $1 AND (status <> 'valid' OR expires_at <= $2)
              )
        )SQL";
        return queryExecutor_->executeCommand(query, {id, std::to_string(now)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Start processing failed: {}", e.what());
        throw;
    }
}

bool OrderRepository::markReadyIfAllAuthorizationsValid(const std::string& id) {
    try {
        const char* query = R"SQL(
            UPDATE acme_order SET status = 'ready'
            WHERE id = $1 AND status = 'pending'
              AND NOT EXISTS (
                  SELECT 1 FROM acme_authorization
                  WHERE order_id = $1 AND status <> 'valid'
              )
        )SQL";

        bool applied = queryExecutor_->executeCommand(query, {id}) > 0;
        if (applied) {
            spdlog::info("[OrderRepository] Order ready: {}", id);
        }
        return applied;
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Mark ready failed: {}", e.what());
        throw;
    }
}

bool OrderRepository::markInvalid(const std::string& id, OrderStatus from, const Json::Value& error) {
    try {
        const char* query =
            "UPDATE acme_order SET status = 'invalid', error = $3 WHERE id = $1 AND status = $2";
        return queryExecutor_->executeCommand(query, {
            id, orderStatusToString(from), common::db::toJsonText(error)}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Mark invalid failed: {}", e.what());
        throw;
    }
}

bool OrderRepository::markValid(const std::string& id, const std::string& certificateSerial) {
    try {
        const char* query = R"SQL(
            UPDATE acme_order SET status = 'valid', certificate_serial = $2
            WHERE id = $1 AND status = 'processing'
        )SQL";
        return queryExecutor_->executeCommand(query, {id, certificateSerial}) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Mark valid failed: {}", e.what());
        throw;
    }
}

int OrderRepository::deleteExpired(std::time_t now) {
    try {
        // Authorizations and challenges go with ON DELETE CASCADE
        const char* query = "DELETE FROM acme_order WHERE expires_at < $1";
        int deleted = queryExecutor_->executeCommand(query, {std::to_string(now)});
        if (deleted > 0) {
            spdlog::info("[OrderRepository] Deleted {} expired orders", deleted);
        }
        return deleted;
    } catch (const std::exception& e) {
        spdlog::error("[OrderRepository] Delete expired failed: {}", e.what());
        throw;
    }
}

Order OrderRepository::rowToOrder(const Json::Value& row) {
    Order order;
    order.id = common::db::getString(row, "id");
    order.accountId = common::db::getString(row, "account_id");
    order.identifiers = common::db::getStringList(row, "identifiers");
    order.status = orderStatusFromString(common::db::getString(row, "status"));
    order.expiresAt = static_cast<std::time_t>(common::db::getInt64(row, "expires_at"));
    if (auto nb = common::db::getOptionalInt64(row, "not_before")) {
        order.notBefore = static_cast<std::time_t>(*nb);
    }
    if (auto na = common::db::getOptionalInt64(row, "not_after")) {
        order.notAfter = static_cast<std::time_t>(*na);
    }
    order.certificateSerial = common::db::getString(row, "certificate_serial");
    order.error = common::db::parseJsonText(row, "error");
    order.createdAt = static_cast<std::time_t>(common::db::getInt64(row, "created_at"));
    return order;
}

} // namespace repositories
