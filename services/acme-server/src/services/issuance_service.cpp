/**
 * @file issuance_service.cpp
 * @brief IssuanceService implementation
 */

#include "issuance_service.h"
#include "../common/exceptions.h"
#include <acme/crypto/base64url.h>
#include <acme/crypto/cert_ops.h>
#include <acme/crypto/csr.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace services {

using namespace domain::models;

IssuanceService::IssuanceService(
    repositories::IOrderRepository* orderRepository,
    repositories::ICertificateRepository* certificateRepository,
    OrderService* orderService,
    const CertificateAuthority* ca,
    common::ITaskExecutor* executor,
    IssuancePolicy policy,
    common::Clock clock)
    : orderRepository_(orderRepository)
    , certificateRepository_(certificateRepository)
    , orderService_(orderService)
    , ca_(ca)
    , executor_(executor)
    , policy_(std::move(policy))
    , clock_(std::move(clock))
{
    if (!orderRepository_ || !certificateRepository_) {
        throw std::invalid_argument("IssuanceService: repositories cannot be nullptr");
    }
    if (!orderService_ || !ca_ || !executor_) {
        throw std::invalid_argument("IssuanceService: dependencies cannot be nullptr");
    }
}

OrderView IssuanceService::finalize(const Account& account, const std::string& orderId, const Json::Value& payload) {
    OrderView view = orderService_->getOrder(account, orderId);

    if (view.order.status == OrderStatus::VALID) {
        return view;
    }
    if (view.order.status != OrderStatus::READY) {
        throw common::OrderNotReadyException(orderStatusToString(view.order.status));
    }

    if (!payload.isObject() || !payload["csr"].isString()) {
        throw common::MalformedException("finalize requires a csr.");
    }
    auto csrDer = acme::crypto::base64UrlDecode(payload["csr"].asString());

    if (!orderRepository_->startProcessing(orderId, clock_())) {
        OrderView current = orderService_->getOrder(account, orderId);
        if (current.order.status == OrderStatus::PROCESSING || current.order.status == OrderStatus::VALID) {
            // Another finalize won; report what it produced
            return current;
        }
        if (current.order.status == OrderStatus::READY) {
            // An authorization lapsed between the read and the transition
            orderRepository_->markInvalid(orderId, OrderStatus::READY,
                common::AcmeProblem(common::ErrorCode::UNAUTHORIZED,
                    "An authorization of this order is no longer valid.").toJson());
        }
        throw common::OrderNotReadyException(orderStatusToString(
            current.order.status == OrderStatus::READY ? OrderStatus::INVALID : current.order.status));
    }

    try {
        if (!csrDer) {
            throw common::BadCsrException("CSR is not valid base64url.");
        }
        checkCsr(view.order, *csrDer);
    } catch (const common::AcmeServiceException& e) {
        spdlog::warn("[IssuanceService] Order {} rejected at finalize: {}", orderId, e.what());
        orderRepository_->markInvalid(orderId, OrderStatus::PROCESSING, e.toProblem().toJson());
        throw;
    }

    std::string der = *csrDer;
    if (!executor_->submit([this, orderId, der] { issue(orderId, der); })) {
        spdlog::error("[IssuanceService] Issuance queue full, order {} failed", orderId);
        orderRepository_->markInvalid(orderId, OrderStatus::PROCESSING,
            common::AcmeProblem(common::ErrorCode::SERVER_INTERNAL, "Issuance could not be scheduled.").toJson());
    }

    return orderService_->getOrder(account, orderId);
}

void IssuanceService::checkCsr(const Order& order, const std::string& csrDer) {
    auto req = acme::crypto::parseCsrDer(csrDer);
    if (!req) {
        throw common::BadCsrException("Unable to parse CSR.");
    }
    if (!acme::crypto::verifyCsrSignature(req.get())) {
        throw common::BadCsrException("CSR signature is invalid.");
    }

    EVP_PKEY* key = X509_REQ_get0_pubkey(req.get());
    auto strength = acme::crypto::checkPublicKeyStrength(key);
    if (!strength.acceptable) {
        throw common::BadPublicKeyException(strength.message);
    }

    auto names = acme::crypto::csrNameSet(acme::crypto::extractCsrNames(req.get()));
    if (!acme::crypto::sameNameSet(names, order.identifiers)) {
        throw common::BadCsrException("CSR names do not match order identifiers");
    }
}

void IssuanceService::issue(const std::string& orderId, const std::string& csrDer) {
    try {
        auto order = orderRepository_->findById(orderId);
        if (!order || order->status != OrderStatus::PROCESSING) {
            spdlog::warn("[IssuanceService] Order {} no longer processing, issuance skipped", orderId);
            return;
        }

        auto req = acme::crypto::parseCsrDer(csrDer);
        if (!req) {
            throw std::runtime_error("CSR became unparsable after validation");
        }

        Certificate cert = signAndStore(*order, req.get());
        if (!orderRepository_->markValid(orderId, cert.serial)) {
            spdlog::warn("[IssuanceService] Order {} left processing before certificate {} was attached",
                orderId, cert.serial);
            return;
        }
        spdlog::info("[IssuanceService] Order {} valid, certificate {} ({})",
            orderId, cert.serial, cert.commonName);
    } catch (const std::exception& e) {
        spdlog::error("[IssuanceService] Issuance failed for order {}: {}", orderId, e.what());
        orderRepository_->markInvalid(orderId, OrderStatus::PROCESSING,
            common::AcmeProblem(common::ErrorCode::SERVER_INTERNAL, "Certificate issuance failed.").toJson());
    }
}

Certificate IssuanceService::signAndStore(const Order& order, X509_REQ* req) {
    const std::time_t now = clock_();

    Certificate cert;
    cert.accountId = order.accountId;
    cert.orderId = order.id;
    cert.commonName = order.identifiers.front();
    cert.sans = order.identifiers;
    cert.issuerSerial = ca_->serial();
    cert.notBefore = order.notBefore.value_or(now);
    cert.notAfter = order.notAfter.value_or(cert.notBefore + policy_.defaultCertValiditySeconds);
    cert.createdAt = now;

    acme::crypto::LeafCertificateRequest request;
    request.subjectKey = X509_REQ_get0_pubkey(req);
    request.commonName = cert.commonName;
    request.dnsNames = cert.sans;
    request.notBefore = cert.notBefore;
    request.notAfter = cert.notAfter;
    request.ocspResponderUrl = policy_.ocspResponderUrl;

    for (int attempt = 0; attempt < policy_.maxSerialAttempts; ++attempt) {
        std::string serial = acme::crypto::generateSerialHex();
        if (certificateRepository_->serialExists(serial)) {
            spdlog::warn("[IssuanceService] Serial {} already used, drawing another", serial);
            continue;
        }

        request.serialHex = serial;
        auto signedCert = acme::crypto::signLeafCertificate(request, ca_->cert(), ca_->key());
        if (!signedCert) {
            throw std::runtime_error("Signing failed for serial " + serial);
        }

        cert.serial = serial;
        cert.pem = acme::crypto::certificateToPem(signedCert.get());
        if (certificateRepository_->insertIfSerialFree(cert)) {
            return cert;
        }
    }
    throw std::runtime_error("No free serial after " + std::to_string(policy_.maxSerialAttempts) + " attempts");
}

std::string IssuanceService::certificateChainPem(const std::string& serial) {
    std::string normalized = serial;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto cert = certificateRepository_->findBySerial(normalized);
    if (!cert) {
        throw common::NotFoundException("Certificate not found.");
    }

    std::string pem = cert->pem;
    if (!pem.empty() && pem.back() != '\n') {
        pem += '\n';
    }
    return pem + ca_->chainPem();
}

} // namespace services
