/**
 * @file nonce_repository.h
 * @brief PostgreSQL repository for anti-replay nonces
 */

#pragma once

#include "repository_interfaces.h"
#include "i_query_executor.h"

namespace repositories {

/**
 * @brief Nonce repository (acme_nonce table)
 *
 * Consumption is a single DELETE ... RETURNING, so two requests racing on
 * the same nonce cannot both see it.
 */
class NonceRepository : public INonceRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit NonceRepository(common::IQueryExecutor* queryExecutor);
    ~NonceRepository() override = default;

    NonceRepository(const NonceRepository&) = delete;
    NonceRepository& operator=(const NonceRepository&) = delete;

    void insert(const std::string& value, std::time_t issuedAt) override;
    bool consume(const std::string& value, std::time_t notBefore) override;
    int deleteIssuedBefore(std::time_t cutoff) override;

private:
    common::IQueryExecutor* queryExecutor_;
};

} // namespace repositories
