/**
 * @file account_service.h
 * @brief ACME account management (RFC 8555 Section 7.3)
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>
#include "request_authenticator.h"
#include "../common/clock.h"
#include "../repositories/repository_interfaces.h"

namespace services {

/**
 * @brief Result of a new-account request
 */
struct AccountRegistration {
    domain::models::Account account;
    bool created = false;           // 201 when true, 200 for an existing key
};

/**
 * @brief Account Service
 *
 * Accounts are keyed by JWK thumbprint. Registration is idempotent: the
 * same key always maps to the same account.
 */
class AccountService {
public:
    /**
     * @param repository Account storage (non-owning)
     * @param requireContact Reject registrations without a contact
     * @throws std::invalid_argument if repository is nullptr
     */
    AccountService(
        repositories::IAccountRepository* repository,
        bool requireContact,
        common::Clock clock = common::systemClock());

    /**
     * @brief new-account
     *
     * Payload fields: contact, termsOfServiceAgreed, onlyReturnExisting.
     *
     * @throws common::AccountDoesNotExistException for onlyReturnExisting
     *         with an unknown key
     * @throws common::InvalidContactException, UnsupportedContactException
     */
    AccountRegistration registerAccount(
        const Json::Value& jwk,
        const std::string& thumbprint,
        const Json::Value& payload);

    /**
     * @brief POST to an account URL
     *
     * Empty payload (POST-as-GET) returns the account. "contact" replaces
     * the contacts; "status": "deactivated" deactivates the account.
     *
     * @param signer Account that signed the request
     * @throws common::UnauthorizedException if signer is not the account
     */
    domain::models::Account update(
        const domain::models::Account& signer,
        const std::string& accountId,
        const Json::Value& payload);

    /**
     * @brief valid -> deactivated
     *
     * Certificates and pending orders are left alone.
     */
    domain::models::Account deactivate(const std::string& accountId);

    /**
     * @brief Key rollover
     *
     * @param accountUrl URL of the signer's account, must equal payload.account
     * @throws common::ConflictException if the new key belongs to another account
     */
    domain::models::Account changeKey(
        const domain::models::Account& signer,
        const std::string& accountUrl,
        const KeyChangeRequest& keyChange,
        const std::string& accountUrlPrefix);

    /**
     * @brief Validate mailto: contact URIs
     * @throws common::UnsupportedContactException for other schemes
     * @throws common::InvalidContactException for malformed addresses
     */
    static std::vector<std::string> validateContacts(const Json::Value& contact);

private:
    repositories::IAccountRepository* repository_;
    bool requireContact_;
    common::Clock clock_;

    domain::models::Account require(const std::string& accountId);
};

} // namespace services
