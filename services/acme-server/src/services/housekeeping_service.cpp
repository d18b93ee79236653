/**
 * @file housekeeping_service.cpp
 * @brief HousekeepingService implementation
 */

#include "housekeeping_service.h"
#include "../common/exceptions.h"
#include <acme/crypto/cert_ops.h>
#include <acme/crypto/crl_builder.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace services {

using namespace domain::models;

Json::Value JobResult::toJson() const {
    Json::Value json(Json::objectValue);
    json["job"] = job;
    json["changed"] = changed;
    json["details"] = details;
    return json;
}

HousekeepingService::HousekeepingService(
    repositories::ICertificateRepository* certificateRepository,
    repositories::ICrlRepository* crlRepository,
    repositories::IOcspKeyRepository* ocspKeyRepository,
    repositories::IOrderRepository* orderRepository,
    NonceService* nonceService,
    middleware::RateLimiter* rateLimiter,
    const CertificateAuthority* ca,
    HousekeepingPolicy policy,
    common::Clock clock)
    : certificateRepository_(certificateRepository)
    , crlRepository_(crlRepository)
    , ocspKeyRepository_(ocspKeyRepository)
    , orderRepository_(orderRepository)
    , nonceService_(nonceService)
    , rateLimiter_(rateLimiter)
    , ca_(ca)
    , policy_(policy)
    , clock_(std::move(clock))
{
    if (!certificateRepository_ || !crlRepository_ || !ocspKeyRepository_ || !orderRepository_) {
        throw std::invalid_argument("HousekeepingService: repositories cannot be nullptr");
    }
    if (!nonceService_ || !ca_) {
        throw std::invalid_argument("HousekeepingService: dependencies cannot be nullptr");
    }
}

const std::vector<std::string>& HousekeepingService::jobNames() {
    static const std::vector<std::string> names = {kCacheCrls, kGenerateOcspKeys, kAcmeCleanup};
    return names;
}

JobResult HousekeepingService::runJob(const std::string& name) {
    if (name == kCacheCrls) return cacheCrls();
    if (name == kGenerateOcspKeys) return generateOcspKeys();
    if (name == kAcmeCleanup) return acmeCleanup();
    throw common::NotFoundException("Unknown job: " + name);
}

// =============================================================================
// cache-crls
// =============================================================================

JobResult HousekeepingService::cacheCrls() {
    JobResult result;
    result.job = kCacheCrls;

    const std::time_t now = clock_();
    const std::string& issuer = ca_->serial();

    std::vector<acme::crypto::RevokedEntry> entries;
    for (const auto& cert : certificateRepository_->findRevokedUnexpired(issuer, now)) {
        acme::crypto::RevokedEntry entry;
        entry.serialHex = cert.serial;
        entry.revokedAt = cert.revokedAt.value_or(now);
        entry.reason = cert.revocationReason.value_or(0);
        entries.push_back(entry);
    }
    const std::string fingerprint = acme::crypto::revokedSetFingerprint(entries);
    result.details["entries"] = static_cast<Json::UInt64>(entries.size());

    auto latest = crlRepository_->findLatest(issuer);
    if (latest && latest->fingerprint == fingerprint &&
        latest->nextUpdate > now + policy_.crlRefreshMarginSeconds) {
        spdlog::debug("[HousekeepingService] CRL {} unchanged", latest->crlNumber);
        result.details["crlNumber"] = static_cast<Json::Int64>(latest->crlNumber);
        return result;
    }

    CrlRecord record;
    record.issuerSerial = issuer;
    // Monotonic even when two CRLs are built within the same second
    record.crlNumber = latest ? std::max<long long>(now, latest->crlNumber + 1) : now;
    record.thisUpdate = now;
    record.nextUpdate = now + policy_.crlValiditySeconds;
    record.fingerprint = fingerprint;

    auto crl = acme::crypto::buildCrl(ca_->cert(), ca_->key(), entries,
        record.thisUpdate, record.nextUpdate, static_cast<long>(record.crlNumber));
    if (!crl) {
        throw std::runtime_error("CRL signing failed");
    }
    record.der = acme::crypto::crlToDer(crl.get());

    result.changed = crlRepository_->storeIfNewer(record);
    result.details["crlNumber"] = static_cast<Json::Int64>(record.crlNumber);
    if (result.changed) {
        spdlog::info("[HousekeepingService] CRL {} stored ({} entries)", record.crlNumber, entries.size());
    } else {
        spdlog::info("[HousekeepingService] CRL {} not stored, a newer one exists", record.crlNumber);
    }
    return result;
}

// =============================================================================
// generate-ocsp-keys
// =============================================================================

JobResult HousekeepingService::generateOcspKeys() {
    JobResult result;
    result.job = kGenerateOcspKeys;

    const std::time_t now = clock_();
    const std::string& issuer = ca_->serial();

    auto newest = ocspKeyRepository_->findNewest(issuer);
    if (newest && newest->notAfter > now + policy_.ocspKeyOverlapSeconds) {
        result.details["generation"] = static_cast<Json::Int64>(newest->generation);
    } else {
        auto key = acme::crypto::generateEcP256Key();
        if (!key) {
            throw std::runtime_error("OCSP responder key generation failed");
        }

        OcspResponderKey record;
        record.issuerSerial = issuer;
        record.generation = newest ? newest->generation + 1 : 1;
        record.serial = acme::crypto::generateSerialHex();
        record.notBefore = now;
        record.notAfter = now + policy_.ocspKeyValiditySeconds;

        auto cert = acme::crypto::signOcspResponderCertificate(
            key.get(), record.serial, record.notBefore, record.notAfter, ca_->cert(), ca_->key());
        if (!cert) {
            throw std::runtime_error("OCSP responder certificate signing failed");
        }
        record.keyPem = acme::crypto::privateKeyToPem(key.get());
        record.certPem = acme::crypto::certificateToPem(cert.get());

        result.changed = ocspKeyRepository_->insertIfGenerationFree(record);
        result.details["generation"] = static_cast<Json::Int64>(record.generation);
        if (result.changed) {
            spdlog::info("[HousekeepingService] OCSP responder key generation {} valid until {}",
                record.generation, acme::crypto::formatRfc3339(record.notAfter));
        } else {
            spdlog::info("[HousekeepingService] OCSP responder key generation {} created concurrently",
                record.generation);
        }
    }

    int pruned = ocspKeyRepository_->deleteExpiredBefore(issuer, now - policy_.ocspKeyOverlapSeconds);
    result.details["pruned"] = pruned;
    if (pruned > 0) {
        result.changed = true;
        spdlog::info("[HousekeepingService] Pruned {} expired OCSP responder keys", pruned);
    }
    return result;
}

// =============================================================================
// acme-cleanup
// =============================================================================

JobResult HousekeepingService::acmeCleanup() {
    JobResult result;
    result.job = kAcmeCleanup;

    if (!policy_.acmeEnabled) {
        spdlog::info("[HousekeepingService] ACME is not enabled, not doing anything.");
        result.details["skipped"] = true;
        return result;
    }

    int orders = orderRepository_->deleteExpired(clock_());
    int nonces = nonceService_->purgeExpired();
    size_t limiterKeys = rateLimiter_ ? rateLimiter_->cleanup() : 0;

    result.changed = orders > 0 || nonces > 0;
    result.details["orders"] = orders;
    result.details["nonces"] = nonces;
    result.details["rateLimitKeys"] = static_cast<Json::UInt64>(limiterKeys);

    spdlog::info("[HousekeepingService] Cleanup removed {} orders, {} nonces", orders, nonces);
    return result;
}

Json::Value HousekeepingService::revocationHealth() const {
    const std::time_t now = clock_();
    const std::string& issuer = ca_->serial();
    bool healthy = true;

    Json::Value crl(Json::objectValue);
    if (auto latest = crlRepository_->findLatest(issuer)) {
        crl["crlNumber"] = static_cast<Json::Int64>(latest->crlNumber);
        crl["nextUpdate"] = acme::crypto::formatRfc3339(latest->nextUpdate);
        crl["stale"] = latest->nextUpdate <= now;
        healthy = healthy && latest->nextUpdate > now;
    } else {
        crl["stale"] = true;
        healthy = false;
    }

    Json::Value responder(Json::objectValue);
    if (auto key = ocspKeyRepository_->findCurrent(issuer, now)) {
        responder["generation"] = static_cast<Json::Int64>(key->generation);
        responder["notAfter"] = acme::crypto::formatRfc3339(key->notAfter);
        responder["available"] = true;
    } else {
        responder["available"] = false;
        healthy = false;
    }

    Json::Value json(Json::objectValue);
    json["status"] = healthy ? "UP" : "DEGRADED";
    json["acmeEnabled"] = policy_.acmeEnabled;
    json["crl"] = crl;
    json["ocspResponder"] = responder;
    return json;
}

} // namespace services
