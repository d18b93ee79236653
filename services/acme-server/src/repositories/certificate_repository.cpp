/**
 * @file certificate_repository.cpp
 * @brief CertificateRepository implementation
 */

#include "certificate_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT serial, account_id, order_id, common_name, sans, issuer_serial,
           not_before, not_after, pem, revoked, revocation_reason, revoked_at, created_at
    FROM acme_certificate
)SQL";

} // anonymous namespace

CertificateRepository::CertificateRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("CertificateRepository: queryExecutor cannot be nullptr");
    }
}

bool CertificateRepository::insertIfSerialFree(const Certificate& certificate) {
    try {
        const char* query = R"SQL(
            INSERT INTO acme_certificate (
                serial, account_id, order_id, common_name, sans, issuer_serial,
                not_before, not_after, pem, revoked, created_at
            ) VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, false, $10)
            ON CONFLICT (serial) DO NOTHING
        )SQL";

        std::vector<std::string> params = {
            certificate.serial,
            certificate.accountId,
            certificate.orderId,
            certificate.commonName,
            common::db::stringListToJsonText(certificate.sans),
            certificate.issuerSerial,
            std::to_string(certificate.notBefore),
            std::to_string(certificate.notAfter),
            certificate.pem,
            std::to_string(certificate.createdAt)
        };

        bool inserted = queryExecutor_->executeCommand(query, params) > 0;
        if (!inserted) {
            spdlog::warn("[CertificateRepository] Serial collision: {}", certificate.serial);
        }
        return inserted;
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] Insert failed: {}", e.what());
        throw;
    }
}

bool CertificateRepository::serialExists(const std::string& serial) {
    try {
        Json::Value count = queryExecutor_->executeScalar(
            "SELECT COUNT(*) FROM acme_certificate WHERE serial = $1", {serial});
        return common::db::scalarToInt64(count) > 0;
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] Serial lookup failed: {}", e.what());
        throw;
    }
}

std::optional<Certificate> CertificateRepository::findBySerial(const std::string& serial) {
    try {
        std::string query = std::string(kSelectColumns) + " WHERE serial = $1";
        Json::Value rows = queryExecutor_->executeQuery(query, {serial});
        if (rows.empty()) {
            return std::nullopt;
        }
        return rowToCertificate(rows[0]);
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] Find by serial failed: {}", e.what());
        throw;
    }
}

bool CertificateRepository::revoke(const std::string& serial, int reason, std::time_t revokedAt) {
    try {
        const char* query = R"SQL(
            UPDATE acme_certificate
            SET revoked = true, revocation_reason = $2, revoked_at = $3
            WHERE serial = $1 AND revoked = false
        )SQL";

        bool applied = queryExecutor_->executeCommand(query, {
            serial, std::to_string(reason), std::to_string(revokedAt)}) > 0;
        if (applied) {
            spdlog::info("[CertificateRepository] Certificate revoked: {} (reason {})", serial, reason);
        }
        return applied;
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] Revoke failed: {}", e.what());
        throw;
    }
}

std::vector<Certificate> CertificateRepository::findRevokedUnexpired(
    const std::string& issuerSerial, std::time_t now)
{
    try {
        std::string query = std::string(kSelectColumns) +
            " WHERE issuer_serial = $1 AND revoked = true AND not_after > $2 ORDER BY serial";

        std::vector<Certificate> result;
        for (const auto& row : queryExecutor_->executeQuery(query, {issuerSerial, std::to_string(now)})) {
            result.push_back(rowToCertificate(row));
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] Find revoked failed: {}", e.what());
        throw;
    }
}

Certificate CertificateRepository::rowToCertificate(const Json::Value& row) {
    Certificate cert;
    cert.serial = common::db::getString(row, "serial");
    cert.accountId = common::db::getString(row, "account_id");
    cert.orderId = common::db::getString(row, "order_id");
    cert.commonName = common::db::getString(row, "common_name");
    cert.sans = common::db::getStringList(row, "sans");
    cert.issuerSerial = common::db::getString(row, "issuer_serial");
    cert.notBefore = static_cast<std::time_t>(common::db::getInt64(row, "not_before"));
    cert.notAfter = static_cast<std::time_t>(common::db::getInt64(row, "not_after"));
    cert.pem = common::db::getString(row, "pem");
    cert.revoked = common::db::getBool(row, "revoked");
    if (auto reason = common::db::getOptionalInt64(row, "revocation_reason")) {
        cert.revocationReason = static_cast<int>(*reason);
    }
    if (auto at = common::db::getOptionalInt64(row, "revoked_at")) {
        cert.revokedAt = static_cast<std::time_t>(*at);
    }
    cert.createdAt = static_cast<std::time_t>(common::db::getInt64(row, "created_at"));
    return cert;
}

} // namespace repositories
