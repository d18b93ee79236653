/**
 * @file issuance_service.h
 * @brief Order finalization and certificate issuance (RFC 8555 Section 7.4)
 */

#pragma once

#include <string>
#include <json/json.h>
#include "certificate_authority.h"
#include "order_service.h"
#include "../common/clock.h"
#include "../common/task_executor.h"
#include "../repositories/repository_interfaces.h"

namespace services {

struct IssuancePolicy {
    long defaultCertValiditySeconds = 90L * 86400;
    std::string ocspResponderUrl;     // Written as AIA when set
    int maxSerialAttempts = 8;
};

/**
 * @brief Issuance Service
 *
 * finalize() checks the CSR on the request thread; the order moves
 * ready -> processing before the checks so concurrent finalize calls see
 * exactly one winner. Signing and storage run on the worker pool:
 *
 *   ready --finalize--> processing --signed+stored--> valid
 *                            \--any failure--------> invalid
 */
class IssuanceService {
public:
    /**
     * @throws std::invalid_argument if a dependency is nullptr
     */
    IssuanceService(
        repositories::IOrderRepository* orderRepository,
        repositories::ICertificateRepository* certificateRepository,
        OrderService* orderService,
        const CertificateAuthority* ca,
        common::ITaskExecutor* executor,
        IssuancePolicy policy,
        common::Clock clock = common::systemClock());

    /**
     * @brief Finalize an order with a CSR
     *
     * @return The order in processing, or valid if issuance already finished
     * @throws common::OrderNotReadyException order is not ready (no state change)
     * @throws common::BadCsrException CSR unusable or names differ; order is invalid
     * @throws common::BadPublicKeyException weak key; order is invalid
     */
    OrderView finalize(const domain::models::Account& account, const std::string& orderId, const Json::Value& payload);

    /**
     * @brief Sign and store the certificate of a processing order
     *
     * Background task body. Failures leave the order invalid with a
     * serverInternal problem.
     */
    void issue(const std::string& orderId, const std::string& csrDer);

    /**
     * @brief Leaf followed by the CA chain, PEM
     * @throws common::NotFoundException unknown serial
     */
    std::string certificateChainPem(const std::string& serial);

private:
    repositories::IOrderRepository* orderRepository_;
    repositories::ICertificateRepository* certificateRepository_;
    OrderService* orderService_;
    const CertificateAuthority* ca_;
    common::ITaskExecutor* executor_;
    IssuancePolicy policy_;
    common::Clock clock_;

    void checkCsr(const domain::models::Order& order, const std::string& csrDer);
    domain::models::Certificate signAndStore(const domain::models::Order& order, X509_REQ* req);
};

} // namespace services
