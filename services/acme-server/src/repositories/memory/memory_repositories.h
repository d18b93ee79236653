/**
 * @file memory_repositories.h
 * @brief In-memory repositories for tests and STORAGE_BACKEND=memory
 *
 * All repositories share one MemoryState. Every operation takes its mutex,
 * which gives the same conditional-update semantics as the PostgreSQL
 * statements within one process.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include "../repository_interfaces.h"

namespace repositories {

/**
 * @brief Tables of the in-memory store
 */
struct MemoryState {
    std::mutex mutex;
    std::map<std::string, std::time_t> nonces;
    std::map<std::string, Account> accounts;                  // by id
    std::map<std::string, Order> orders;                      // by id
    std::map<std::string, Authorization> authorizations;      // by id
    std::map<std::string, Challenge> challenges;              // by id
    std::map<std::string, Certificate> certificates;          // by serial
    std::map<std::string, CrlRecord> crls;                    // by issuer serial
    std::map<std::pair<std::string, long long>, OcspResponderKey> ocspKeys;
};

class MemoryNonceRepository : public INonceRepository {
public:
    explicit MemoryNonceRepository(std::shared_ptr<MemoryState> state);

    void insert(const std::string& value, std::time_t issuedAt) override;
    bool consume(const std::string& value, std::time_t notBefore) override;
    int deleteIssuedBefore(std::time_t cutoff) override;

private:
    std::shared_ptr<MemoryState> state_;
};

class MemoryAccountRepository : public IAccountRepository {
public:
    explicit MemoryAccountRepository(std::shared_ptr<MemoryState> state);

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
    std::shared_ptr<MemoryState> state_;
};

class MemoryOrderRepository : public IOrderRepository {
public:
    explicit MemoryOrderRepository(std::shared_ptr<MemoryState> state);

    void createWithAuthorizations(
        const Order& order,
        const std::vector<Authorization>& authorizations,
        const std::vector<Challenge>& challenges) override;

    std::optional<Order> findById(const std::string& id) override;
    std::vector<std::string> findIdsByAccount(const std::string& accountId) override;
    bool startProcessing(const std::string& id, std::time_t now) override;
    bool markReadyIfAllAuthorizationsValid(const std::string& id) override;
    bool markInvalid(const std::string& id, OrderStatus from, const Json::Value& error) override;
    bool markValid(const std::string& id, const std::string& certificateSerial) override;
    int deleteExpired(std::time_t now) override;

private:
    std::shared_ptr<MemoryState> state_;
};

class MemoryAuthorizationRepository : public IAuthorizationRepository {
public:
    explicit MemoryAuthorizationRepository(std::shared_ptr<MemoryState> state);

    std::optional<Authorization> findById(const std::string& id) override;
    std::vector<Authorization> findByOrder(const std::string& orderId) override;
    bool transition(const std::string& id, AuthorizationStatus from, AuthorizationStatus to) override;

private:
    std::shared_ptr<MemoryState> state_;
};

class MemoryChallengeRepository : public IChallengeRepository {
public:
    explicit MemoryChallengeRepository(std::shared_ptr<MemoryState> state);

    std::optional<Challenge> findById(const std::string& id) override;
    std::vector<Challenge> findByAuthorization(const std::string& authorizationId) override;
    bool startProcessing(const std::string& id) override;
    bool recordAttempt(const std::string& id, int attempts, const Json::Value& error) override;
    bool markValid(const std::string& id, std::time_t validatedAt) override;
    bool markInvalid(const std::string& id, const Json::Value& error) override;

private:
    std::shared_ptr<MemoryState> state_;
};

class MemoryCertificateRepository : public ICertificateRepository {
public:
    explicit MemoryCertificateRepository(std::shared_ptr<MemoryState> state);

    bool insertIfSerialFree(const Certificate& certificate) override;
    bool serialExists(const std::string& serial) override;
    std::optional<Certificate> findBySerial(const std::string& serial) override;
    bool revoke(const std::string& serial, int reason, std::time_t revokedAt) override;
    std::vector<Certificate> findRevokedUnexpired(const std::string& issuerSerial, std::time_t now) override;

private:
    std::shared_ptr<MemoryState> state_;
};

class MemoryCrlRepository : public ICrlRepository {
public:
    explicit MemoryCrlRepository(std::shared_ptr<MemoryState> state);

    std::optional<CrlRecord> findLatest(const std::string& issuerSerial) override;
    bool storeIfNewer(const CrlRecord& record) override;

private:
    std::shared_ptr<MemoryState> state_;
};

class MemoryOcspKeyRepository : public IOcspKeyRepository {
public:
    explicit MemoryOcspKeyRepository(std::shared_ptr<MemoryState> state);

    std::optional<OcspResponderKey> findNewest(const std::string& issuerSerial) override;
    std::optional<OcspResponderKey> findCurrent(const std::string& issuerSerial, std::time_t now) override;
    bool insertIfGenerationFree(const OcspResponderKey& key) override;
    int deleteExpiredBefore(const std::string& issuerSerial, std::time_t cutoff) override;

private:
    std::shared_ptr<MemoryState> state_;
};

} // namespace repositories
