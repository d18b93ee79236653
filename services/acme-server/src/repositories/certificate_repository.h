/**
 * @file certificate_repository.h
 * @brief PostgreSQL repository for issued certificates
 */

#pragma once

#include "repository_interfaces.h"
#include "i_query_executor.h"

namespace repositories {

/**
 * @brief Certificate repository (acme_certificate table)
 */
class CertificateRepository : public ICertificateRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit CertificateRepository(common::IQueryExecutor* queryExecutor);
    ~CertificateRepository() override = default;

    CertificateRepository(const CertificateRepository&) = delete;
    CertificateRepository& operator=(const CertificateRepository&) = delete;

    bool insertIfSerialFree(const Certificate& certificate) override;
    bool serialExists(const std::string& serial) override;
    std::optional<Certificate> findBySerial(const std::string& serial) override;
    bool revoke(const std::string& serial, int reason, std::time_t revokedAt) override;
    std::vector<Certificate> findRevokedUnexpired(const std::string& issuerSerial, std::time_t now) override;

private:
    common::IQueryExecutor* queryExecutor_;

    static Certificate rowToCertificate(const Json::Value& row);
};

} // namespace repositories
