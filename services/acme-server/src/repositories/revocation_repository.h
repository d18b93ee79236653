/**
 * @file revocation_repository.h
 * @brief PostgreSQL repositories for CRLs and OCSP responder keys
 */

#pragma once

#include "repository_interfaces.h"
#include "i_query_executor.h"

namespace repositories {

/**
 * @brief CRL cache (acme_crl table)
 *
 * DER bytes are kept base64url-encoded in a TEXT column.
 */
class CrlRepository : public ICrlRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit CrlRepository(common::IQueryExecutor* queryExecutor);
    ~CrlRepository() override = default;

    CrlRepository(const CrlRepository&) = delete;
    CrlRepository& operator=(const CrlRepository&) = delete;

    std::optional<CrlRecord> findLatest(const std::string& issuerSerial) override;
    bool storeIfNewer(const CrlRecord& record) override;

private:
    common::IQueryExecutor* queryExecutor_;
};

/**
 * @brief OCSP responder keys (acme_ocsp_key table)
 */
class OcspKeyRepository : public IOcspKeyRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit OcspKeyRepository(common::IQueryExecutor* queryExecutor);
    ~OcspKeyRepository() override = default;

    OcspKeyRepository(const OcspKeyRepository&) = delete;
    OcspKeyRepository& operator=(const OcspKeyRepository&) = delete;

    std::optional<OcspResponderKey> findNewest(const std::string& issuerSerial) override;
    std::optional<OcspResponderKey> findCurrent(const std::string& issuerSerial, std::time_t now) override;
    bool insertIfGenerationFree(const OcspResponderKey& key) override;
    int deleteExpiredBefore(const std::string& issuerSerial, std::time_t cutoff) override;

private:
    common::IQueryExecutor* queryExecutor_;

    static OcspResponderKey rowToKey(const Json::Value& row);
};

} // namespace repositories
