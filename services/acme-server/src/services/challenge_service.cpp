/**
 * @file challenge_service.cpp
 * @brief ChallengeService implementation
 */

#include "challenge_service.h"
#include "../common/exceptions.h"
#include <acme/crypto/base64url.h>
#include <acme/crypto/jwk.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace services {

using namespace domain::models;

namespace {

Json::Value problemJson(common::ErrorCode code, const std::string& detail) {
    return common::AcmeProblem(code, detail).toJson();
}

} // anonymous namespace

ChallengeService::ChallengeService(
    repositories::IAccountRepository* accountRepository,
    repositories::IAuthorizationRepository* authorizationRepository,
    repositories::IChallengeRepository* challengeRepository,
    OrderService* orderService,
    common::ITaskExecutor* executor,
    IHttpFetcher* httpFetcher,
    IDnsTxtResolver* dnsResolver,
    IChallengeResponsePublisher* publisher,
    ValidationPolicy policy,
    common::Clock clock)
    : accountRepository_(accountRepository)
    , authorizationRepository_(authorizationRepository)
    , challengeRepository_(challengeRepository)
    , orderService_(orderService)
    , executor_(executor)
    , httpFetcher_(httpFetcher)
    , dnsResolver_(dnsResolver)
    , publisher_(publisher)
    , policy_(policy)
    , clock_(std::move(clock))
{
    if (!accountRepository_ || !authorizationRepository_ || !challengeRepository_) {
        throw std::invalid_argument("ChallengeService: repositories cannot be nullptr");
    }
    if (!orderService_ || !executor_ || !httpFetcher_ || !dnsResolver_) {
        throw std::invalid_argument("ChallengeService: dependencies cannot be nullptr");
    }
}

Challenge ChallengeService::getChallenge(const Account& account, const std::string& challengeId) {
    auto challenge = challengeRepository_->findById(challengeId);
    if (!challenge) {
        throw common::UnauthorizedException("You are not authorized to access this resource.",
            "challenge " + challengeId + " not found");
    }
    auto authz = authorizationRepository_->findById(challenge->authorizationId);
    if (!authz) {
        throw common::UnauthorizedException("You are not authorized to access this resource.");
    }
    orderService_->requireOwnedOrder(account, authz->orderId);
    return *challenge;
}

std::string ChallengeService::authorizationIdOf(const std::string& challengeId) {
    auto challenge = challengeRepository_->findById(challengeId);
    return challenge ? challenge->authorizationId : std::string();
}

Challenge ChallengeService::respond(const Account& account, const std::string& challengeId) {
    Challenge challenge = getChallenge(account, challengeId);

    // Applies lazy expiry to the authorization before deciding
    auto authzView = orderService_->getAuthorization(account, challenge.authorizationId);
    if (challenge.status != ChallengeStatus::PENDING ||
        authzView.authorization.status != AuthorizationStatus::PENDING) {
        spdlog::debug("[ChallengeService] Challenge {} not startable ({}), returned unchanged",
            challengeId, challengeStatusToString(challenge.status));
        return challenge;
    }

    if (!challengeRepository_->startProcessing(challengeId)) {
        // Lost the race, or a sibling challenge was selected first
        spdlog::debug("[ChallengeService] Challenge {} not started, another challenge of {} is selected",
            challengeId, challenge.authorizationId);
        return *challengeRepository_->findById(challengeId);
    }

    if (publisher_ && challenge.type == ChallengeType::HTTP_01) {
        try {
            publisher_->publish(challenge.token, acme::crypto::keyAuthorization(challenge.token, account.jwk));
        } catch (const std::exception& e) {
            // The probe reports the missing response as the validation error
            spdlog::error("[ChallengeService] Publishing response for {} failed: {}", challengeId, e.what());
        }
    }

    std::string accountId = account.id;
    bool queued = executor_->submit([this, challengeId, accountId] {
        validate(challengeId, accountId);
    });
    if (!queued) {
        spdlog::error("[ChallengeService] Validation queue full, challenge {} failed", challengeId);
        auto current = challengeRepository_->findById(challengeId);
        if (current) {
            fail(*current, authzView.authorization,
                 problemJson(common::ErrorCode::SERVER_INTERNAL, "Validation could not be scheduled."));
        }
    } else {
        spdlog::info("[ChallengeService] Challenge {} ({}) queued for {}",
            challengeId, challengeTypeToString(challenge.type), authzView.authorization.identifier);
    }

    return *challengeRepository_->findById(challengeId);
}

ProbeOutcome ChallengeService::probe(
    const Challenge& challenge,
    const std::string& identifier,
    const std::string& keyAuthorization)
{
    ProbeOutcome outcome;

    if (challenge.type == ChallengeType::HTTP_01) {
        std::string url = "http://" + identifier + "/.well-known/acme-challenge/" + challenge.token;
        auto result = httpFetcher_->fetch(url, policy_.probeTimeoutSeconds);
        if (!result.connected) {
            outcome.retryable = true;
            outcome.error = common::ErrorCode::VALIDATION_CONNECTION;
            outcome.detail = url + ": " + result.error;
        } else if (result.statusCode != 200) {
            outcome.error = common::ErrorCode::VALIDATION_INCORRECT_RESPONSE;
            outcome.detail = url + ": HTTP status " + std::to_string(result.statusCode);
        } else if (result.body != keyAuthorization) {
            outcome.error = common::ErrorCode::VALIDATION_INCORRECT_RESPONSE;
            outcome.detail = url + ": Response does not match the key authorization.";
        } else {
            outcome.valid = true;
        }
        return outcome;
    }

    std::string name = "_acme-challenge." + identifier;
    std::string expected = acme::crypto::base64UrlEncode(acme::crypto::sha256(keyAuthorization));
    auto result = dnsResolver_->resolveTxt(name, policy_.probeTimeoutSeconds);
    if (!result.resolved) {
        outcome.retryable = true;
        outcome.error = common::ErrorCode::VALIDATION_DNS;
        outcome.detail = name + ": " + result.error;
        return outcome;
    }
    for (const auto& record : result.records) {
        if (record == expected) {
            outcome.valid = true;
            return outcome;
        }
    }
    outcome.error = common::ErrorCode::VALIDATION_INCORRECT_RESPONSE;
    outcome.detail = name + ": No TXT record matches the key authorization.";
    return outcome;
}

void ChallengeService::validate(const std::string& challengeId, const std::string& accountId) {
    auto challenge = challengeRepository_->findById(challengeId);
    if (!challenge || challenge->status != ChallengeStatus::PROCESSING) {
        return;
    }
    auto authz = authorizationRepository_->findById(challenge->authorizationId);
    auto account = accountRepository_->findById(accountId);
    if (!authz || !account) {
        spdlog::error("[ChallengeService] Challenge {} lost its authorization or account", challengeId);
        return;
    }

    const std::string keyAuth = acme::crypto::keyAuthorization(challenge->token, account->jwk);

    ProbeOutcome outcome;
    for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        outcome = probe(*challenge, authz->identifier, keyAuth);
        if (outcome.valid) {
            break;
        }

        spdlog::warn("[ChallengeService] Challenge {} attempt {}/{} failed: {}",
            challengeId, attempt, policy_.maxAttempts, outcome.detail);
        challengeRepository_->recordAttempt(challengeId, attempt,
            problemJson(outcome.error, outcome.detail));

        if (!outcome.retryable || attempt == policy_.maxAttempts) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(policy_.retryBaseMs << (attempt - 1)));
    }

    if (publisher_ && challenge->type == ChallengeType::HTTP_01) {
        publisher_->withdraw(challenge->token);
    }

    if (!outcome.valid) {
        fail(*challenge, *authz, problemJson(outcome.error, outcome.detail));
        return;
    }

    if (!challengeRepository_->markValid(challengeId, clock_())) {
        return;
    }
    if (authorizationRepository_->transition(authz->id, AuthorizationStatus::PENDING, AuthorizationStatus::VALID)) {
        spdlog::info("[ChallengeService] Authorization {} valid ({})", authz->id, authz->identifier);
        orderService_->onAuthorizationValid(authz->orderId);
    }
}

void ChallengeService::fail(const Challenge& challenge, const Authorization& authz, const Json::Value& error) {
    if (!challengeRepository_->markInvalid(challenge.id, error)) {
        return;
    }
    spdlog::info("[ChallengeService] Challenge {} invalid: {}", challenge.id, error["detail"].asString());
    if (authorizationRepository_->transition(authz.id, AuthorizationStatus::PENDING, AuthorizationStatus::INVALID)) {
        orderService_->onAuthorizationInvalid(authz.orderId, error);
    }
}

} // namespace services
