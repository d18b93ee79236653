/**
 * @file nonce_service.cpp
 * @brief NonceService implementation
 */

#include "nonce_service.h"
#include <acme/crypto/base64url.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

namespace {
constexpr size_t kNonceBytes = 32;
}

NonceService::NonceService(
    repositories::INonceRepository* repository,
    long lifetimeSeconds,
    common::Clock clock)
    : repository_(repository)
    , lifetimeSeconds_(lifetimeSeconds)
    , clock_(std::move(clock))
{
    if (!repository_) {
        throw std::invalid_argument("NonceService: repository cannot be nullptr");
    }
}

std::string NonceService::issue() {
    std::string nonce = acme::crypto::randomBase64Url(kNonceBytes);
    repository_->insert(nonce, clock_());
    return nonce;
}

bool NonceService::consume(const std::string& nonce) {
    bool accepted = repository_->consume(nonce, clock_() - lifetimeSeconds_);
    if (!accepted) {
        spdlog::debug("[NonceService] Rejected nonce: {}", nonce);
    }
    return accepted;
}

int NonceService::purgeExpired() {
    int removed = repository_->deleteIssuedBefore(clock_() - lifetimeSeconds_);
    spdlog::info("[NonceService] Purged {} expired nonces", removed);
    return removed;
}

} // namespace services
