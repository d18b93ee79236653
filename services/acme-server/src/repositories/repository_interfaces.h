/**
 * @file repository_interfaces.h
 * @brief Persistence interfaces, one per entity
 *
 * Services depend only on these. Two implementations exist:
 *   - PostgreSQL repositories (production, horizontally scalable)
 *   - Memory repositories (tests and STORAGE_BACKEND=memory)
 *
 * Every state change is a conditional update that reports whether it
 * applied. Callers must not assume the transition happened; on false they
 * reload and act on the current state.
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>

#include "../domain/models/account.h"
#include "../domain/models/authorization.h"
#include "../domain/models/certificate.h"
#include "../domain/models/order.h"

namespace repositories {

using domain::models::Account;
using domain::models::AccountStatus;
using domain::models::Authorization;
using domain::models::AuthorizationStatus;
using domain::models::Certificate;
using domain::models::Challenge;
using domain::models::ChallengeStatus;
using domain::models::CrlRecord;
using domain::models::OcspResponderKey;
using domain::models::Order;
using domain::models::OrderStatus;

/**
 * @brief Anti-replay nonces
 */
class INonceRepository {
public:
    virtual ~INonceRepository() = default;

    virtual void insert(const std::string& value, std::time_t issuedAt) = 0;

    /**
     * @brief Consume a nonce
     *
     * The nonce is removed whether or not it is still fresh. Of several
     * concurrent calls with the same value at most one returns true.
     *
     * @return true if the nonce existed and was issued at or after notBefore
     */
    virtual bool consume(const std::string& value, std::time_t notBefore) = 0;

    /// @return Number of nonces removed
    virtual int deleteIssuedBefore(std::time_t cutoff) = 0;
};

/**
 * @brief ACME accounts, unique by key thumbprint
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    virtual std::optional<Account> findById(const std::string& id) = 0;
    virtual std::optional<Account> findByThumbprint(const std::string& thumbprint) = 0;

    /**
     * @brief Insert unless an account with the same thumbprint exists
     * @return The stored account, and true if this call created it
     */
    virtual std::pair<Account, bool> insertIfAbsent(const Account& account) = 0;

    /// @brief Replace contacts of a valid account
    virtual bool updateContacts(const std::string& id, const std::vector<std::string>& contacts) = 0;

    virtual bool updateStatus(const std::string& id, AccountStatus from, AccountStatus to) = 0;

    /**
     * @brief Key rollover
     *
     * Applies only while the account still has oldThumbprint and no other
     * account has newThumbprint.
     */
    virtual bool updateKey(
        const std::string& id,
        const std::string& oldThumbprint,
        const Json::Value& newJwk,
        const std::string& newThumbprint) = 0;
};

/**
 * @brief Orders
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Insert an order with its authorizations and challenges atomically
     */
    virtual void createWithAuthorizations(
        const Order& order,
        const std::vector<Authorization>& authorizations,
        const std::vector<Challenge>& challenges) = 0;

    virtual std::optional<Order> findById(const std::string& id) = 0;

    /// @brief Ids of an account's orders, newest first
    virtual std::vector<std::string> findIdsByAccount(const std::string& accountId) = 0;

    /**
     * @brief ready -> processing, conditioned on the order being unexpired and
     *        every authorization still valid and unexpired at @p now
     */
    virtual bool startProcessing(const std::string& id, std::time_t now) = 0;

    /**
     * @brief pending -> ready, conditioned on every authorization being valid
     */
    virtual bool markReadyIfAllAuthorizationsValid(const std::string& id) = 0;

    /// @brief from -> invalid, recording the problem document
    virtual bool markInvalid(const std::string& id, OrderStatus from, const Json::Value& error) = 0;

    /// @brief processing -> valid, recording the certificate serial
    virtual bool markValid(const std::string& id, const std::string& certificateSerial) = 0;

    /**
     * @brief Delete expired orders with their authorizations and challenges
     * @return Number of orders removed
     */
    virtual int deleteExpired(std::time_t now) = 0;
};

/**
 * @brief Authorizations
 */
class IAuthorizationRepository {
public:
    virtual ~IAuthorizationRepository() = default;

    virtual std::optional<Authorization> findById(const std::string& id) = 0;
    virtual std::vector<Authorization> findByOrder(const std::string& orderId) = 0;
    virtual bool transition(const std::string& id, AuthorizationStatus from, AuthorizationStatus to) = 0;
};

/**
 * @brief Challenges
 */
class IChallengeRepository {
public:
    virtual ~IChallengeRepository() = default;

    virtual std::optional<Challenge> findById(const std::string& id) = 0;
    virtual std::vector<Challenge> findByAuthorization(const std::string& authorizationId) = 0;
    /**
     * @brief pending -> processing, unless another challenge of the same
     *        authorization is already processing or valid
     */
    virtual bool startProcessing(const std::string& id) = 0;

    /// @brief Record a failed probe of a processing challenge
    virtual bool recordAttempt(const std::string& id, int attempts, const Json::Value& error) = 0;

    /// @brief processing -> valid
    virtual bool markValid(const std::string& id, std::time_t validatedAt) = 0;

    /// @brief processing -> invalid
    virtual bool markInvalid(const std::string& id, const Json::Value& error) = 0;
};

/**
 * @brief Issued certificates
 */
class ICertificateRepository {
public:
    virtual ~ICertificateRepository() = default;

    /// @return false if the serial is already taken
    virtual bool insertIfSerialFree(const Certificate& certificate) = 0;

    virtual bool serialExists(const std::string& serial) = 0;
    virtual std::optional<Certificate> findBySerial(const std::string& serial) = 0;

    /**
     * @brief Write-once revocation
     * @return false if unknown or already revoked
     */
    virtual bool revoke(const std::string& serial, int reason, std::time_t revokedAt) = 0;

    /// @brief Revoked certificates of an issuer that have not yet expired
    virtual std::vector<Certificate> findRevokedUnexpired(const std::string& issuerSerial, std::time_t now) = 0;
};

/**
 * @brief Cached CRLs
 */
class ICrlRepository {
public:
    virtual ~ICrlRepository() = default;

    virtual std::optional<CrlRecord> findLatest(const std::string& issuerSerial) = 0;

    /// @return false unless record.crlNumber exceeds the stored number
    virtual bool storeIfNewer(const CrlRecord& record) = 0;
};

/**
 * @brief OCSP responder keys
 */
class IOcspKeyRepository {
public:
    virtual ~IOcspKeyRepository() = default;

    /// @brief Highest generation, whatever its validity
    virtual std::optional<OcspResponderKey> findNewest(const std::string& issuerSerial) = 0;

    /// @brief Highest generation valid at now
    virtual std::optional<OcspResponderKey> findCurrent(const std::string& issuerSerial, std::time_t now) = 0;

    /// @return false if (issuer, generation) already exists
    virtual bool insertIfGenerationFree(const OcspResponderKey& key) = 0;

    /// @return Number of keys removed
    virtual int deleteExpiredBefore(const std::string& issuerSerial, std::time_t cutoff) = 0;
};

} // namespace repositories
