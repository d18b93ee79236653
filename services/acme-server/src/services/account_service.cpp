/**
 * @file account_service.cpp
 * @brief AccountService implementation
 */

#include "account_service.h"
#include "../common/dns_name.h"
#include "../common/exceptions.h"
#include "../common/id_generator.h"
#include <acme/crypto/jwk.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::Account;
using domain::models::AccountStatus;

namespace {

constexpr const char* kMailtoPrefix = "mailto:";

void validateMailto(const std::string& contact) {
    std::string addr = contact.substr(std::string(kMailtoPrefix).size());

    // Quoted local parts could hide ',' and '?' from the checks below
    if (!addr.empty() && addr.front() == '"') {
        throw common::InvalidContactException("Quoted local part in email is not allowed.");
    }
    if (addr.find(',') != std::string::npos) {
        throw common::InvalidContactException("More than one addr-spec is not allowed.");
    }

    auto at = addr.find('@');
    if (at == std::string::npos || at == 0) {
        throw common::InvalidContactException(addr + ": Not a valid email address.");
    }
    std::string domain = addr.substr(at + 1);
    if (domain.find('?') != std::string::npos) {
        throw common::InvalidContactException(domain + ": hfields are not allowed.");
    }
    if (!common::isValidDnsName(common::normalizeDnsName(domain))) {
        throw common::InvalidContactException(domain + ": Not a valid email address.");
    }
}

} // anonymous namespace

AccountService::AccountService(
    repositories::IAccountRepository* repository,
    bool requireContact,
    common::Clock clock)
    : repository_(repository)
    , requireContact_(requireContact)
    , clock_(std::move(clock))
{
    if (!repository_) {
        throw std::invalid_argument("AccountService: repository cannot be nullptr");
    }
}

std::vector<std::string> AccountService::validateContacts(const Json::Value& contact) {
    std::vector<std::string> contacts;
    if (contact.isNull()) {
        return contacts;
    }
    if (!contact.isArray()) {
        throw common::MalformedException("contact must be an array of URIs.");
    }

    for (const auto& item : contact) {
        if (!item.isString()) {
            throw common::MalformedException("contact must be an array of URIs.");
        }
        const std::string value = item.asString();
        if (value.compare(0, std::string(kMailtoPrefix).size(), kMailtoPrefix) != 0) {
            throw common::UnsupportedContactException(value + ": Unsupported address scheme.");
        }
        validateMailto(value);
        contacts.push_back(value);
    }
    return contacts;
}

AccountRegistration AccountService::registerAccount(
    const Json::Value& jwk,
    const std::string& thumbprint,
    const Json::Value& payload)
{
    if (!payload.isObject()) {
        throw common::MalformedException("new-account requires a JSON payload.");
    }

    if (auto existing = repository_->findByThumbprint(thumbprint)) {
        spdlog::debug("[AccountService] Existing account for key: {}", existing->id);
        return {*existing, false};
    }

    if (payload.get("onlyReturnExisting", false).asBool()) {
        throw common::AccountDoesNotExistException("Account does not exist.");
    }

    auto contacts = validateContacts(payload["contact"]);
    if (requireContact_ && contacts.empty()) {
        throw common::InvalidContactException("Must provide at least one contact address.");
    }

    Account account;
    account.id = common::generateUuid();
    account.jwk = jwk;
    account.thumbprint = thumbprint;
    account.status = AccountStatus::VALID;
    account.contacts = contacts;
    account.termsOfServiceAgreed = payload.get("termsOfServiceAgreed", false).asBool();
    account.createdAt = clock_();

    // A concurrent registration with the same key may win; return its account
    auto [stored, created] = repository_->insertIfAbsent(account);
    if (created) {
        spdlog::info("[AccountService] Registered account {} ({} contacts)", stored.id, contacts.size());
    }
    return {stored, created};
}

Account AccountService::update(
    const Account& signer,
    const std::string& accountId,
    const Json::Value& payload)
{
    if (signer.id != accountId) {
        throw common::UnauthorizedException("Request is not signed by this account.");
    }
    if (payload.isNull()) {
        return require(accountId);
    }
    if (!payload.isObject()) {
        throw common::MalformedException("Account update requires a JSON object.");
    }

    if (payload.isMember("status")) {
        if (payload["status"].asString() != "deactivated") {
            throw common::MalformedException("Accounts can only be deactivated.");
        }
        return deactivate(accountId);
    }

    if (payload.isMember("contact")) {
        auto contacts = validateContacts(payload["contact"]);
        if (requireContact_ && contacts.empty()) {
            throw common::InvalidContactException("Must provide at least one contact address.");
        }
        if (!repository_->updateContacts(accountId, contacts)) {
            throw common::UnauthorizedException("Account is not valid.");
        }
        spdlog::info("[AccountService] Updated contacts of account {}", accountId);
    }
    return require(accountId);
}

Account AccountService::deactivate(const std::string& accountId) {
    if (repository_->updateStatus(accountId, AccountStatus::VALID, AccountStatus::DEACTIVATED)) {
        spdlog::info("[AccountService] Account deactivated: {}", accountId);
    }
    return require(accountId);
}

Account AccountService::changeKey(
    const Account& signer,
    const std::string& accountUrl,
    const KeyChangeRequest& keyChange,
    const std::string& accountUrlPrefix)
{
    const auto& payload = keyChange.payload;
    if (!payload["account"].isString() || payload["account"].asString() != accountUrl) {
        throw common::MalformedException("Inner JWS account does not match the signing account.");
    }
    if (!payload["oldKey"].isObject()) {
        throw common::MalformedException("Inner JWS requires oldKey.");
    }

    std::string oldThumbprint;
    try {
        oldThumbprint = acme::crypto::jwkThumbprint(payload["oldKey"]);
    } catch (const std::exception& e) {
        throw common::MalformedException(std::string("Invalid oldKey: ") + e.what());
    }
    if (oldThumbprint != signer.thumbprint) {
        throw common::UnauthorizedException("oldKey does not match the account key.");
    }

    if (auto holder = repository_->findByThumbprint(keyChange.newThumbprint)) {
        throw common::ConflictException("New key is already in use by another account.",
                                        accountUrlPrefix + holder->id);
    }

    if (!repository_->updateKey(signer.id, signer.thumbprint, keyChange.newJwk, keyChange.newThumbprint)) {
        if (auto holder = repository_->findByThumbprint(keyChange.newThumbprint)) {
            throw common::ConflictException("New key is already in use by another account.",
                                            accountUrlPrefix + holder->id);
        }
        throw common::UnauthorizedException("Account key changed concurrently.");
    }

    spdlog::info("[AccountService] Key rollover for account {}", signer.id);
    return require(signer.id);
}

Account AccountService::require(const std::string& accountId) {
    auto account = repository_->findById(accountId);
    if (!account) {
        throw common::AccountDoesNotExistException("Account does not exist.");
    }
    return *account;
}

} // namespace services
