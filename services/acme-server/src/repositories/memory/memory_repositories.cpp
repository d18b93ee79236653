/**
 * @file memory_repositories.cpp
 * @brief In-memory repository implementations
 */

#include "memory_repositories.h"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace repositories {

namespace {

std::shared_ptr<MemoryState> requireState(std::shared_ptr<MemoryState> state, const char* owner) {
    if (!state) {
        throw std::invalid_argument(std::string(owner) + ": state cannot be nullptr");
    }
    return state;
}

template <typename Map>
auto findIn(Map& map, const typename Map::key_type& key)
    -> std::optional<typename Map::mapped_type>
{
    auto it = map.find(key);
    if (it == map.end()) return std::nullopt;
    return it->second;
}

} // anonymous namespace

// =============================================================================
// Nonces
// =============================================================================

MemoryNonceRepository::MemoryNonceRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryNonceRepository")) {}

void MemoryNonceRepository::insert(const std::string& value, std::time_t issuedAt) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->nonces[value] = issuedAt;
}

bool MemoryNonceRepository::consume(const std::string& value, std::time_t notBefore) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->nonces.find(value);
    if (it == state_->nonces.end()) {
        return false;
    }
    std::time_t issuedAt = it->second;
    state_->nonces.erase(it);
    return issuedAt >= notBefore;
}

int MemoryNonceRepository::deleteIssuedBefore(std::time_t cutoff) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    int removed = 0;
    for (auto it = state_->nonces.begin(); it != state_->nonces.end();) {
        if (it->second < cutoff) {
            it = state_->nonces.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// =============================================================================
// Accounts
// =============================================================================

MemoryAccountRepository::MemoryAccountRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryAccountRepository")) {}

std::optional<Account> MemoryAccountRepository::findById(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return findIn(state_->accounts, id);
}

std::optional<Account> MemoryAccountRepository::findByThumbprint(const std::string& thumbprint) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (const auto& [id, account] : state_->accounts) {
        if (account.thumbprint == thumbprint) return account;
    }
    return std::nullopt;
}

std::pair<Account, bool> MemoryAccountRepository::insertIfAbsent(const Account& account) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (const auto& [id, existing] : state_->accounts) {
        if (existing.thumbprint == account.thumbprint) return {existing, false};
    }
    state_->accounts[account.id] = account;
    return {account, true};
}

bool MemoryAccountRepository::updateContacts(const std::string& id, const std::vector<std::string>& contacts) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->accounts.find(id);
    if (it == state_->accounts.end() || !it->second.isValid()) return false;
    it->second.contacts = contacts;
    return true;
}

bool MemoryAccountRepository::updateStatus(const std::string& id, AccountStatus from, AccountStatus to) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->accounts.find(id);
    if (it == state_->accounts.end() || it->second.status != from) return false;
    it->second.status = to;
    return true;
}

bool MemoryAccountRepository::updateKey(
    const std::string& id,
    const std::string& oldThumbprint,
    const Json::Value& newJwk,
    const std::string& newThumbprint)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (const auto& [otherId, other] : state_->accounts) {
        if (other.thumbprint == newThumbprint) return false;
    }
    auto it = state_->accounts.find(id);
    if (it == state_->accounts.end() || it->second.thumbprint != oldThumbprint || !it->second.isValid()) {
        return false;
    }
    it->second.jwk = newJwk;
    it->second.thumbprint = newThumbprint;
    return true;
}

// =============================================================================
// Orders
// =============================================================================

MemoryOrderRepository::MemoryOrderRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryOrderRepository")) {}

void MemoryOrderRepository::createWithAuthorizations(
    const Order& order,
    const std::vector<Authorization>& authorizations,
    const std::vector<Challenge>& challenges)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->orders.count(order.id)) {
        throw std::runtime_error("Duplicate order id: " + order.id);
    }
    state_->orders[order.id] = order;
    for (const auto& authz : authorizations) state_->authorizations[authz.id] = authz;
    for (const auto& challenge : challenges) state_->challenges[challenge.id] = challenge;
}

std::optional<Order> MemoryOrderRepository::findById(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return findIn(state_->orders, id);
}

std::vector<std::string> MemoryOrderRepository::findIdsByAccount(const std::string& accountId) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<const Order*> owned;
    for (const auto& [id, order] : state_->orders) {
        if (order.accountId == accountId) owned.push_back(&order);
    }
    std::stable_sort(owned.begin(), owned.end(), [](const Order* a, const Order* b) {
        return a->createdAt > b->createdAt;
    });

    std::vector<std::string> ids;
    for (const auto* order : owned) ids.push_back(order->id);
    return ids;
}

bool MemoryOrderRepository::startProcessing(const std::string& id, std::time_t now) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->orders.find(id);
    if (it == state_->orders.end() || it->second.status != OrderStatus::READY || it->second.expiresAt <= now) {
        return false;
    }
    for (const auto& [authzId, authz] : state_->authorizations) {
        if (authz.orderId == id && (authz.status != AuthorizationStatus::VALID || authz.expiresAt <= now)) {
            return false;
        }
    }
    it->second.status = OrderStatus::PROCESSING;
    return true;
}

bool MemoryOrderRepository::markReadyIfAllAuthorizationsValid(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->orders.find(id);
    if (it == state_->orders.end() || it->second.status != OrderStatus::PENDING) return false;

    for (const auto& [authzId, authz] : state_->authorizations) {
        if (authz.orderId == id && authz.status != AuthorizationStatus::VALID) return false;
    }
    it->second.status = OrderStatus::READY;
    return true;
}

bool MemoryOrderRepository::markInvalid(const std::string& id, OrderStatus from, const Json::Value& error) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->orders.find(id);
    if (it == state_->orders.end() || it->second.status != from) return false;
    it->second.status = OrderStatus::INVALID;
    it->second.error = error;
    return true;
}

bool MemoryOrderRepository::markValid(const std::string& id, const std::string& certificateSerial) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->orders.find(id);
    if (it == state_->orders.end() || it->second.status != OrderStatus::PROCESSING) return false;
    it->second.status = OrderStatus::VALID;
    it->second.certificateSerial = certificateSerial;
    return true;
}

int MemoryOrderRepository::deleteExpired(std::time_t now) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    int removed = 0;
    for (auto orderIt = state_->orders.begin(); orderIt != state_->orders.end();) {
        if (orderIt->second.expiresAt >= now) {
            ++orderIt;
            continue;
        }

        const std::string orderId = orderIt->first;
        for (auto authzIt = state_->authorizations.begin(); authzIt != state_->authorizations.end();) {
            if (authzIt->second.orderId != orderId) {
                ++authzIt;
                continue;
            }
            const std::string authzId = authzIt->first;
            for (auto chIt = state_->challenges.begin(); chIt != state_->challenges.end();) {
                chIt = (chIt->second.authorizationId == authzId) ? state_->challenges.erase(chIt) : std::next(chIt);
            }
            authzIt = state_->authorizations.erase(authzIt);
        }
        orderIt = state_->orders.erase(orderIt);
        ++removed;
    }
    return removed;
}

// =============================================================================
// Authorizations
// =============================================================================

MemoryAuthorizationRepository::MemoryAuthorizationRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryAuthorizationRepository")) {}

std::optional<Authorization> MemoryAuthorizationRepository::findById(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return findIn(state_->authorizations, id);
}

std::vector<Authorization> MemoryAuthorizationRepository::findByOrder(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<Authorization> result;
    for (const auto& [id, authz] : state_->authorizations) {
        if (authz.orderId == orderId) result.push_back(authz);
    }
    std::sort(result.begin(), result.end(), [](const Authorization& a, const Authorization& b) {
        return a.identifier < b.identifier;
    });
    return result;
}

bool MemoryAuthorizationRepository::transition(
    const std::string& id, AuthorizationStatus from, AuthorizationStatus to)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->authorizations.find(id);
    if (it == state_->authorizations.end() || it->second.status != from) return false;
    it->second.status = to;
    return true;
}

// =============================================================================
// Challenges
// =============================================================================

MemoryChallengeRepository::MemoryChallengeRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryChallengeRepository")) {}

std::optional<Challenge> MemoryChallengeRepository::findById(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return findIn(state_->challenges, id);
}

std::vector<Challenge> MemoryChallengeRepository::findByAuthorization(const std::string& authorizationId) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<Challenge> result;
    for (const auto& [id, challenge] : state_->challenges) {
        if (challenge.authorizationId == authorizationId) result.push_back(challenge);
    }
    // Same order as the SQL repository (ORDER BY type): dns-01 before http-01
    std::sort(result.begin(), result.end(), [](const Challenge& a, const Challenge& b) {
        return domain::models::challengeTypeToString(a.type) < domain::models::challengeTypeToString(b.type);
    });
    return result;
}

bool MemoryChallengeRepository::startProcessing(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->challenges.find(id);
    if (it == state_->challenges.end() || it->second.status != ChallengeStatus::PENDING) return false;

    for (const auto& [otherId, other] : state_->challenges) {
        if (otherId != id && other.authorizationId == it->second.authorizationId &&
            (other.status == ChallengeStatus::PROCESSING || other.status == ChallengeStatus::VALID)) {
            return false;
        }
    }
    it->second.status = ChallengeStatus::PROCESSING;
    return true;
}

bool MemoryChallengeRepository::recordAttempt(const std::string& id, int attempts, const Json::Value& error) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->challenges.find(id);
    if (it == state_->challenges.end() || it->second.status != ChallengeStatus::PROCESSING) return false;
    it->second.attempts = attempts;
    it->second.error = error;
    return true;
}

bool MemoryChallengeRepository::markValid(const std::string& id, std::time_t validatedAt) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->challenges.find(id);
    if (it == state_->challenges.end() || it->second.status != ChallengeStatus::PROCESSING) return false;
    it->second.status = ChallengeStatus::VALID;
    it->second.validatedAt = validatedAt;
    it->second.error = Json::nullValue;
    return true;
}

bool MemoryChallengeRepository::markInvalid(const std::string& id, const Json::Value& error) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->challenges.find(id);
    if (it == state_->challenges.end() || it->second.status != ChallengeStatus::PROCESSING) return false;
    it->second.status = ChallengeStatus::INVALID;
    it->second.error = error;
    return true;
}

// =============================================================================
// Certificates
// =============================================================================

MemoryCertificateRepository::MemoryCertificateRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryCertificateRepository")) {}

bool MemoryCertificateRepository::insertIfSerialFree(const Certificate& certificate) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->certificates.emplace(certificate.serial, certificate).second;
}

bool MemoryCertificateRepository::serialExists(const std::string& serial) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->certificates.count(serial) > 0;
}

std::optional<Certificate> MemoryCertificateRepository::findBySerial(const std::string& serial) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return findIn(state_->certificates, serial);
}

bool MemoryCertificateRepository::revoke(const std::string& serial, int reason, std::time_t revokedAt) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->certificates.find(serial);
    if (it == state_->certificates.end() || it->second.revoked) return false;
    it->second.revoked = true;
    it->second.revocationReason = reason;
    it->second.revokedAt = revokedAt;
    return true;
}

std::vector<Certificate> MemoryCertificateRepository::findRevokedUnexpired(
    const std::string& issuerSerial, std::time_t now)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<Certificate> result;
    for (const auto& [serial, cert] : state_->certificates) {
        if (cert.issuerSerial == issuerSerial && cert.revoked && cert.notAfter > now) {
            result.push_back(cert);
        }
    }
    return result;
}

// =============================================================================
// CRLs
// =============================================================================

MemoryCrlRepository::MemoryCrlRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryCrlRepository")) {}

std::optional<CrlRecord> MemoryCrlRepository::findLatest(const std::string& issuerSerial) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return findIn(state_->crls, issuerSerial);
}

bool MemoryCrlRepository::storeIfNewer(const CrlRecord& record) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->crls.find(record.issuerSerial);
    if (it != state_->crls.end() && it->second.crlNumber >= record.crlNumber) return false;
    state_->crls[record.issuerSerial] = record;
    return true;
}

// =============================================================================
// OCSP responder keys
// =============================================================================

MemoryOcspKeyRepository::MemoryOcspKeyRepository(std::shared_ptr<MemoryState> state)
    : state_(requireState(std::move(state), "MemoryOcspKeyRepository")) {}

std::optional<OcspResponderKey> MemoryOcspKeyRepository::findNewest(const std::string& issuerSerial) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::optional<OcspResponderKey> newest;
    for (const auto& [key, value] : state_->ocspKeys) {
        if (key.first == issuerSerial && (!newest || value.generation > newest->generation)) newest = value;
    }
    return newest;
}

std::optional<OcspResponderKey> MemoryOcspKeyRepository::findCurrent(
    const std::string& issuerSerial, std::time_t now)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::optional<OcspResponderKey> current;
    for (const auto& [key, value] : state_->ocspKeys) {
        if (key.first != issuerSerial || value.notBefore > now || value.notAfter <= now) continue;
        if (!current || value.generation > current->generation) current = value;
    }
    return current;
}

bool MemoryOcspKeyRepository::insertIfGenerationFree(const OcspResponderKey& key) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->ocspKeys.emplace(std::make_pair(key.issuerSerial, key.generation), key).second;
}

int MemoryOcspKeyRepository::deleteExpiredBefore(const std::string& issuerSerial, std::time_t cutoff) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    int removed = 0;
    for (auto it = state_->ocspKeys.begin(); it != state_->ocspKeys.end();) {
        if (it->first.first == issuerSerial && it->second.notAfter < cutoff) {
            it = state_->ocspKeys.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace repositories
