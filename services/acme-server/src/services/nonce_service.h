/**
 * @file nonce_service.h
 * @brief Anti-replay nonce issuance and consumption (RFC 8555 Section 6.5)
 */

#pragma once

#include <string>
#include "../common/clock.h"
#include "../repositories/repository_interfaces.h"

namespace services {

/**
 * @brief Nonce Service
 *
 * Nonces are 32 bytes from the OpenSSL CSPRNG, base64url encoded, stored
 * with their issue time and deleted when consumed.
 */
class NonceService {
public:
    /**
     * @param repository Nonce storage (non-owning)
     * @param lifetimeSeconds Nonces older than this are rejected
     * @throws std::invalid_argument if repository is nullptr
     */
    NonceService(
        repositories::INonceRepository* repository,
        long lifetimeSeconds,
        common::Clock clock = common::systemClock());

    /// @brief Issue and store a fresh nonce
    std::string issue();

    /**
     * @brief Consume a nonce
     * @return true exactly once per issued, unexpired nonce
     */
    bool consume(const std::string& nonce);

    /// @brief Remove nonces past their lifetime
    int purgeExpired();

private:
    repositories::INonceRepository* repository_;
    long lifetimeSeconds_;
    common::Clock clock_;
};

} // namespace services
