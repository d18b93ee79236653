/**
 * @file exceptions.h
 * @brief Exception hierarchy for the ACME server
 *
 * Services throw these; the API layer turns them into problem documents.
 * The message is the client-visible detail. Anything in details is for the
 * server log only.
 */

#pragma once

#include <stdexcept>
#include <string>
#include "error_codes.h"

namespace common {

/**
 * @brief Base exception for all ACME server errors
 */
class AcmeServiceException : public std::runtime_error {
private:
    ErrorCode code_;
    std::string details_;

public:
    explicit AcmeServiceException(
        ErrorCode code,
        const std::string& message,
        const std::string& details = "")
        : std::runtime_error(message)
        , code_(code)
        , details_(details) {}

    ErrorCode getCode() const {
        return code_;
    }

    const std::string& getDetails() const {
        return details_;
    }

    AcmeProblem toProblem() const {
        return AcmeProblem(code_, what());
    }
};

// =============================================================================
// Request Authentication
// =============================================================================

class BadNonceException : public AcmeServiceException {
public:
    explicit BadNonceException(const std::string& message = "JWS has an invalid anti-replay nonce")
        : AcmeServiceException(ErrorCode::BAD_NONCE, message) {}
};

class BadSignatureAlgorithmException : public AcmeServiceException {
public:
    explicit BadSignatureAlgorithmException(const std::string& message)
        : AcmeServiceException(ErrorCode::BAD_SIGNATURE_ALGORITHM, message) {}
};

class MalformedException : public AcmeServiceException {
public:
    explicit MalformedException(const std::string& message, const std::string& details = "")
        : AcmeServiceException(ErrorCode::MALFORMED, message, details) {}
};

class UnsupportedMediaTypeException : public AcmeServiceException {
public:
    explicit UnsupportedMediaTypeException(const std::string& contentType)
        : AcmeServiceException(
            ErrorCode::UNSUPPORTED_MEDIA_TYPE,
            "Requests must use the application/jose+json content type",
            "Content-Type: " + contentType) {}
};

class UnauthorizedException : public AcmeServiceException {
public:
    explicit UnauthorizedException(const std::string& message, const std::string& details = "")
        : AcmeServiceException(ErrorCode::UNAUTHORIZED, message, details) {}
};

class AccountDoesNotExistException : public AcmeServiceException {
public:
    explicit AccountDoesNotExistException(const std::string& message = "Account does not exist")
        : AcmeServiceException(ErrorCode::ACCOUNT_DOES_NOT_EXIST, message) {}
};

class RateLimitedException : public AcmeServiceException {
private:
    long retryAfterSeconds_;

public:
    RateLimitedException(const std::string& message, long retryAfterSeconds)
        : AcmeServiceException(ErrorCode::RATE_LIMITED, message)
        , retryAfterSeconds_(retryAfterSeconds) {}

    long getRetryAfterSeconds() const { return retryAfterSeconds_; }
};

// =============================================================================
// Account
// =============================================================================

class InvalidContactException : public AcmeServiceException {
public:
    explicit InvalidContactException(const std::string& message)
        : AcmeServiceException(ErrorCode::INVALID_CONTACT, message) {}
};

class UnsupportedContactException : public AcmeServiceException {
public:
    explicit UnsupportedContactException(const std::string& message)
        : AcmeServiceException(ErrorCode::UNSUPPORTED_CONTACT, message) {}
};

class ConflictException : public AcmeServiceException {
private:
    std::string location_;

public:
    ConflictException(const std::string& message, const std::string& location = "")
        : AcmeServiceException(ErrorCode::CONFLICT, message)
        , location_(location) {}

    /// @brief URL of the conflicting resource, if any
    const std::string& getLocation() const { return location_; }
};

// =============================================================================
// Order and Issuance
// =============================================================================

class OrderNotReadyException : public AcmeServiceException {
public:
    explicit OrderNotReadyException(const std::string& status)
        : AcmeServiceException(
            ErrorCode::ORDER_NOT_READY,
            "Order is not ready for finalization (status: " + status + ")") {}
};

class RejectedIdentifierException : public AcmeServiceException {
public:
    explicit RejectedIdentifierException(const std::string& message)
        : AcmeServiceException(ErrorCode::REJECTED_IDENTIFIER, message) {}
};

class UnsupportedIdentifierException : public AcmeServiceException {
public:
    explicit UnsupportedIdentifierException(const std::string& message)
        : AcmeServiceException(ErrorCode::UNSUPPORTED_IDENTIFIER, message) {}
};

class BadCsrException : public AcmeServiceException {
public:
    explicit BadCsrException(const std::string& message)
        : AcmeServiceException(ErrorCode::BAD_CSR, message) {}
};

class BadPublicKeyException : public AcmeServiceException {
public:
    explicit BadPublicKeyException(const std::string& message)
        : AcmeServiceException(ErrorCode::BAD_PUBLIC_KEY, message) {}
};

// =============================================================================
// Revocation
// =============================================================================

class BadRevocationReasonException : public AcmeServiceException {
public:
    explicit BadRevocationReasonException(int reason)
        : AcmeServiceException(
            ErrorCode::BAD_REVOCATION_REASON,
            "Revocation reason " + std::to_string(reason) + " is not allowed") {}
};

class AlreadyRevokedException : public AcmeServiceException {
public:
    AlreadyRevokedException()
        : AcmeServiceException(ErrorCode::ALREADY_REVOKED, "Certificate is already revoked") {}
};

// =============================================================================
// Resources and System
// =============================================================================

class NotFoundException : public AcmeServiceException {
public:
    explicit NotFoundException(const std::string& message)
        : AcmeServiceException(ErrorCode::NOT_FOUND, message) {}
};

class ServerInternalException : public AcmeServiceException {
public:
    explicit ServerInternalException(const std::string& details)
        : AcmeServiceException(ErrorCode::SERVER_INTERNAL, "Internal server error", details) {}
};

} // namespace common
