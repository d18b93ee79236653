/**
 * @file error_codes.h
 * @brief ACME error codes and problem documents (RFC 8555 Section 6.7, RFC 7807)
 *
 * Every client-visible failure maps to one ErrorCode, which determines the
 * problem type URN and the HTTP status.
 */

#pragma once

#include <string>
#include <json/json.h>

namespace common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    SUCCESS = 0,

    // Request authentication (1000-1999)
    BAD_NONCE = 1001,
    BAD_SIGNATURE_ALGORITHM = 1002,
    MALFORMED = 1003,
    UNSUPPORTED_MEDIA_TYPE = 1004,   // "malformed" problem with status 415
    UNAUTHORIZED = 1005,
    ACCOUNT_DOES_NOT_EXIST = 1006,
    RATE_LIMITED = 1007,

    // Account (2000-2999)
    INVALID_CONTACT = 2001,
    UNSUPPORTED_CONTACT = 2002,
    CONFLICT = 2003,

    // Order and issuance (3000-3999)
    ORDER_NOT_READY = 3001,
    REJECTED_IDENTIFIER = 3002,
    UNSUPPORTED_IDENTIFIER = 3003,
    BAD_CSR = 3004,
    BAD_PUBLIC_KEY = 3005,

    // Revocation (4000-4999)
    BAD_REVOCATION_REASON = 4001,
    ALREADY_REVOKED = 4002,

    // Challenge validation (5000-5999), recorded on challenges only
    VALIDATION_CONNECTION = 5001,
    VALIDATION_DNS = 5002,
    VALIDATION_INCORRECT_RESPONSE = 5003,

    // Resources (6000-6999)
    NOT_FOUND = 6001,

    // System (9000-9999)
    SERVER_INTERNAL = 9001,
};

/**
 * @brief ACME problem type name ("badNonce", "malformed", ...)
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";

        case ErrorCode::BAD_NONCE: return "badNonce";
        case ErrorCode::BAD_SIGNATURE_ALGORITHM: return "badSignatureAlgorithm";
        case ErrorCode::MALFORMED: return "malformed";
        case ErrorCode::UNSUPPORTED_MEDIA_TYPE: return "malformed";
        case ErrorCode::UNAUTHORIZED: return "unauthorized";
        case ErrorCode::ACCOUNT_DOES_NOT_EXIST: return "accountDoesNotExist";
        case ErrorCode::RATE_LIMITED: return "rateLimited";

        case ErrorCode::INVALID_CONTACT: return "invalidContact";
        case ErrorCode::UNSUPPORTED_CONTACT: return "unsupportedContact";
        case ErrorCode::CONFLICT: return "conflict";

        case ErrorCode::ORDER_NOT_READY: return "orderNotReady";
        case ErrorCode::REJECTED_IDENTIFIER: return "rejectedIdentifier";
        case ErrorCode::UNSUPPORTED_IDENTIFIER: return "unsupportedIdentifier";
        case ErrorCode::BAD_CSR: return "badCSR";
        case ErrorCode::BAD_PUBLIC_KEY: return "badPublicKey";

        case ErrorCode::BAD_REVOCATION_REASON: return "badRevocationReason";
        case ErrorCode::ALREADY_REVOKED: return "alreadyRevoked";

        case ErrorCode::VALIDATION_CONNECTION: return "connection";
        case ErrorCode::VALIDATION_DNS: return "dns";
        case ErrorCode::VALIDATION_INCORRECT_RESPONSE: return "incorrectResponse";

        case ErrorCode::NOT_FOUND: return "notFound";

        case ErrorCode::SERVER_INTERNAL: return "serverInternal";

        default: return "serverInternal";
    }
}

/**
 * @brief HTTP status for an error code
 */
inline int errorCodeToHttpStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return 200;
        case ErrorCode::UNSUPPORTED_MEDIA_TYPE: return 415;
        case ErrorCode::UNAUTHORIZED: return 403;
        case ErrorCode::ORDER_NOT_READY: return 403;
        case ErrorCode::RATE_LIMITED: return 429;
        case ErrorCode::CONFLICT: return 409;
        case ErrorCode::NOT_FOUND: return 404;
        case ErrorCode::SERVER_INTERNAL: return 500;
        default: break;
    }

    int numericCode = static_cast<int>(code);
    if (numericCode >= 1000 && numericCode < 7000) {
        return 400;
    }
    return 500;
}

/**
 * @brief ACME problem document
 */
class AcmeProblem {
private:
    ErrorCode code_;
    std::string detail_;

public:
    static constexpr const char* kTypePrefix = "urn:ietf:params:acme:error:";
    static constexpr const char* kContentType = "application/problem+json";

    AcmeProblem(ErrorCode code, const std::string& detail)
        : code_(code), detail_(detail) {}

    ErrorCode code() const { return code_; }
    const std::string& detail() const { return detail_; }

    /// @brief Full type URN
    std::string type() const { return kTypePrefix + errorCodeToString(code_); }

    int status() const { return errorCodeToHttpStatus(code_); }

    /**
     * @brief Problem JSON: {"type", "detail", "status"}
     */
    Json::Value toJson() const {
        Json::Value json(Json::objectValue);
        json["type"] = type();
        json["detail"] = detail_;
        json["status"] = status();
        return json;
    }
};

} // namespace common
