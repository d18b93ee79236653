/**
 * @file authorization_repository.h
 * @brief PostgreSQL repositories for authorizations and challenges
 */

#pragma once

#include "repository_interfaces.h"
#include "i_query_executor.h"

namespace repositories {

/**
 * @brief Authorization repository (acme_authorization table)
 */
class AuthorizationRepository : public IAuthorizationRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit AuthorizationRepository(common::IQueryExecutor* queryExecutor);
    ~AuthorizationRepository() override = default;

    AuthorizationRepository(const AuthorizationRepository&) = delete;
    AuthorizationRepository& operator=(const AuthorizationRepository&) = delete;

    std::optional<Authorization> findById(const std::string& id) override;
    std::vector<Authorization> findByOrder(const std::string& orderId) override;
    bool transition(const std::string& id, AuthorizationStatus from, AuthorizationStatus to) override;

private:
    common::IQueryExecutor* queryExecutor_;

    static Authorization rowToAuthorization(const Json::Value& row);
};

/**
 * @brief Challenge repository (acme_challenge table)
 */
class ChallengeRepository : public IChallengeRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit ChallengeRepository(common::IQueryExecutor* queryExecutor);
    ~ChallengeRepository() override = default;

    ChallengeRepository(const ChallengeRepository&) = delete;
    ChallengeRepository& operator=(const ChallengeRepository&) = delete;

    std::optional<Challenge> findById(const std::string& id) override;
    std::vector<Challenge> findByAuthorization(const std::string& authorizationId) override;
    bool startProcessing(const std::string& id) override;
    bool recordAttempt(const std::string& id, int attempts, const Json::Value& error) override;
    bool markValid(const std::string& id, std::time_t validatedAt) override;
    bool markInvalid(const std::string& id, const Json::Value& error) override;

private:
    common::IQueryExecutor* queryExecutor_;

    static Challenge rowToChallenge(const Json::Value& row);
};

} // namespace repositories
