/**
 * @file revocation_repository.cpp
 * @brief CrlRepository and OcspKeyRepository implementation
 */

#include "revocation_repository.h"
#include "query_helpers.h"
#include <acme/crypto/base64url.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

// =============================================================================
// CrlRepository
// =============================================================================

CrlRepository::CrlRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("CrlRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<CrlRecord> CrlRepository::findLatest(const std::string& issuerSerial) {
    try {
        const char* query = R"SQL(
            SELECT issuer_serial, crl_number, this_update, next_update, fingerprint, der_b64
            FROM acme_crl
            WHERE issuer_serial = $1
            ORDER BY crl_number DESC
            LIMIT 1
        )SQL";

        Json::Value rows = queryExecutor_->executeQuery(query, {issuerSerial});
        if (rows.empty()) {
            return std::nullopt;
        }

        const auto& row = rows[0];
        auto der = acme::crypto::base64UrlDecode(common::db::getString(row, "der_b64"));
        if (!der) {
            throw std::runtime_error("Stored CRL is not valid base64url");
        }

        CrlRecord record;
        record.issuerSerial = common::db::getString(row, "issuer_serial");
        record.crlNumber = common::db::getInt64(row, "crl_number");
        record.thisUpdate = static_cast<std::time_t>(common::db::getInt64(row, "this_update"));
        record.nextUpdate = static_cast<std::time_t>(common::db::getInt64(row, "next_update"));
        record.fingerprint = common::db::getString(row, "fingerprint");
        record.der = *der;
        return record;
    } catch (const std::exception& e) {
        spdlog::error("[CrlRepository] Find latest failed: {}", e.what());
        throw;
    }
}

bool CrlRepository::storeIfNewer(const CrlRecord& record) {
    try {
        const char* query = R"SQL(
            INSERT INTO acme_crl (issuer_serial, crl_number, this_update, next_update, fingerprint, der_b64)
            SELECT $1::text, $2::bigint, $3::bigint, $4::bigint, $5::text, $6::text
            WHERE NOT EXISTS (
                SELECT 1 FROM acme_crl WHERE issuer_serial = $1::text AND crl_number >= $2::bigint
            )
            ON CONFLICT DO NOTHING
        )SQL";

        std::vector<std::string> params = {
            record.issuerSerial,
            std::to_string(record.crlNumber),
            std::to_string(record.thisUpdate),
            std::to_string(record.nextUpdate),
            record.fingerprint,
            acme::crypto::base64UrlEncode(record.der)
        };

        bool stored = queryExecutor_->executeCommand(query, params) > 0;
        if (stored) {
            // Older CRLs are never served again
            queryExecutor_->executeCommand(
                "DELETE FROM acme_crl WHERE issuer_serial = $1 AND crl_number < $2::bigint",
                {record.issuerSerial, std::to_string(record.crlNumber)});
        }
        return stored;
    } catch (const std::exception& e) {
        spdlog::error("[CrlRepository] Store failed: {}", e.what());
        throw;
    }
}

// =============================================================================
// OcspKeyRepository
// =============================================================================

namespace {

constexpr const char* kKeyColumns = R"SQL(
    SELECT issuer_serial, generation, serial, key_pem, cert_pem, not_before, not_after
    FROM acme_ocsp_key
)SQL";

} // anonymous namespace

OcspKeyRepository::OcspKeyRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("OcspKeyRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<OcspResponderKey> OcspKeyRepository::findNewest(const std::string& issuerSerial) {
    try {
        std::string query = std::string(kKeyColumns) +
            " WHERE issuer_serial = $1 ORDER BY generation DESC LIMIT 1";
        Json::Value rows = queryExecutor_->executeQuery(query, {issuerSerial});
        if (rows.empty()) {
            return std::nullopt;
        }
        return rowToKey(rows[0]);
    } catch (const std::exception& e) {
        spdlog::error("[OcspKeyRepository] Find newest failed: {}", e.what());
        throw;
    }
}

std::optional<OcspResponderKey> OcspKeyRepository::findCurrent(
    const std::string& issuerSerial, std::time_t now)
{
    try {
        std::string query = std::string(kKeyColumns) +
            " WHERE issuer_serial = $1 AND not_before <= $2 AND not_after > $2"
            " ORDER BY generation DESC LIMIT 1";
        Json::Value rows = queryExecutor_->executeQuery(query, {issuerSerial, std::to_string(now)});
        if (rows.empty()) {
            return std::nullopt;
        }
        return rowToKey(rows[0]);
    } catch (const std::exception& e) {
        spdlog::error("[OcspKeyRepository] Find current failed: {}", e.what());
        throw;
    }
}

bool OcspKeyRepository::insertIfGenerationFree(const OcspResponderKey& key) {
    try {
        const char* query = R"SQL(
            INSERT INTO acme_ocsp_key (
                issuer_serial, generation, serial, key_pem, cert_pem, not_before, not_after
            ) VALUES ($1, $2, $3, $4, $5, $6, $7)
            ON CONFLICT (issuer_serial, generation) DO NOTHING
        )SQL";

        return queryExecutor_->executeCommand(query, {
            key.issuerSerial,
            std::to_string(key.generation),
            key.serial,
            key.keyPem,
            key.certPem,
            std::to_string(key.notBefore),
            std::to_string(key.notAfter)
        }) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[OcspKeyRepository] Insert failed: {}", e.what());
        throw;
    }
}

int OcspKeyRepository::deleteExpiredBefore(const std::string& issuerSerial, std::time_t cutoff) {
    try {
        const char* query = "DELETE FROM acme_ocsp_key WHERE issuer_serial = $1 AND not_after < $2";
        return queryExecutor_->executeCommand(query, {issuerSerial, std::to_string(cutoff)});
    } catch (const std::exception& e) {
        spdlog::error("[OcspKeyRepository] Prune failed: {}", e.what());
        throw;
    }
}

OcspResponderKey OcspKeyRepository::rowToKey(const Json::Value& row) {
    OcspResponderKey key;
    key.issuerSerial = common::db::getString(row, "issuer_serial");
    key.generation = common::db::getInt64(row, "generation");
    key.serial = common::db::getString(row, "serial");
    key.keyPem = common::db::getString(row, "key_pem");
    key.certPem = common::db::getString(row, "cert_pem");
    key.notBefore = static_cast<std::time_t>(common::db::getInt64(row, "not_before"));
    key.notAfter = static_cast<std::time_t>(common::db::getInt64(row, "not_after"));
    return key;
}

} // namespace repositories
