/**
 * @file test_support.h
 * @brief In-process ACME server and client for service tests
 *
 * AcmeHarness wires the memory repositories, a throwaway CA, fake probes
 * and an inline executor into the real services, so a test drives the
 * complete account / order / challenge / finalize flow without a database,
 * network or background threads. AcmeTestClient signs requests the way an
 * ACME client would.
 */

#pragma once

#include <atomic>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <json/json.h>

#include <acme/crypto/base64url.h>
#include <acme/crypto/cert_ops.h>
#include <acme/crypto/jwk.h>
#include <acme/crypto/jws.h>
#include "../../../shared/lib/acme-crypto/tests/test_helpers.h"

#include "common/acme_urls.h"
#include "common/clock.h"
#include "common/task_executor.h"
#include "middleware/rate_limiter.h"
#include "repositories/memory/memory_repositories.h"
#include "services/account_service.h"
#include "services/acme_api_service.h"
#include "services/certificate_authority.h"
#include "services/challenge_probe.h"
#include "services/challenge_service.h"
#include "services/housekeeping_service.h"
#include "services/issuance_service.h"
#include "services/nonce_service.h"
#include "services/ocsp_responder_service.h"
#include "services/order_service.h"
#include "services/request_authenticator.h"
#include "services/revocation_service.h"

namespace acme_test {

constexpr const char* kBaseUrl = "https://acme.test/acme";
constexpr std::time_t kStartTime = 1750000000;

inline std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

inline Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder reader;
    std::unique_ptr<Json::CharReader> parser(reader.newCharReader());
    Json::Value root;
    std::string errs;
    parser->parse(text.data(), text.data() + text.size(), &root, &errs);
    return root;
}

// --- Test Doubles ---

class ManualClock {
public:
    explicit ManualClock(std::time_t start = kStartTime) : now_(start) {}

    common::Clock clock() {
        return [this] { return now_.load(); };
    }
    std::time_t now() const { return now_.load(); }
    void advance(long seconds) { now_ += seconds; }

private:
    std::atomic<std::time_t> now_;
};

/// Runs each task on the caller's thread, or refuses it when not accepting
class InlineExecutor : public common::ITaskExecutor {
public:
    bool accepting = true;
    int submitted = 0;

    bool submit(std::function<void()> task) override {
        if (!accepting) return false;
        ++submitted;
        task();
        return true;
    }
};

/// Holds tasks until runAll(), to observe the processing states
class DeferredExecutor : public common::ITaskExecutor {
public:
    bool submit(std::function<void()> task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
        return true;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    void runAll() {
        std::vector<std::function<void()>> tasks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks.swap(tasks_);
        }
        for (auto& task : tasks) task();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::function<void()>> tasks_;
};

/// Switches between InlineExecutor and DeferredExecutor behavior
class SwitchableExecutor : public common::ITaskExecutor {
public:
    bool deferred = false;
    InlineExecutor inlineExecutor;
    DeferredExecutor deferredExecutor;

    bool submit(std::function<void()> task) override {
        return deferred ? deferredExecutor.submit(std::move(task))
                        : inlineExecutor.submit(std::move(task));
    }
};

class FakeHttpFetcher : public services::IHttpFetcher {
public:
    services::HttpFetchResult fetch(const std::string& url, int /* timeoutSeconds */) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(url);
        auto it = responses_.find(url);
        if (it != responses_.end()) {
            return it->second;
        }
        services::HttpFetchResult result;
        result.connected = false;
        result.error = "Connection refused";
        return result;
    }

    void serve(const std::string& url, int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        services::HttpFetchResult result;
        result.connected = true;
        result.statusCode = status;
        result.body = body;
        responses_[url] = result;
    }

    size_t requestCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& r : requests_) {
            if (r == url) ++count;
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, services::HttpFetchResult> responses_;
    std::vector<std::string> requests_;
};

class FakeDnsResolver : public services::IDnsTxtResolver {
public:
    services::DnsTxtResult resolveTxt(const std::string& name, int /* timeoutSeconds */) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++queries_;
        auto it = records_.find(name);
        services::DnsTxtResult result;
        if (it == records_.end()) {
            result.resolved = false;
            result.error = "SERVFAIL";
            return result;
        }
        result.resolved = true;
        result.records = it->second;
        return result;
    }

    void setTxt(const std::string& name, std::vector<std::string> values) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[name] = std::move(values);
    }

    int queries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> records_;
    int queries_ = 0;
};

class RecordingPublisher : public services::IChallengeResponsePublisher {
public:
    std::map<std::string, std::string> published;
    std::vector<std::string> withdrawn;

    void publish(const std::string& token, const std::string& keyAuthorization) override {
        published[token] = keyAuthorization;
    }
    void withdraw(const std::string& token) override {
        withdrawn.push_back(token);
        published.erase(token);
    }
};

// --- Server ---

struct HarnessOptions {
    bool acmeEnabled = true;
    bool requireContact = false;
    middleware::RateLimits newAccountLimits;
    middleware::RateLimits newOrderLimits;
    long orderValiditySeconds = 3600;
    bool withPublisher = false;
};

/**
 * @brief Real services over memory storage with a fresh CA
 */
class AcmeHarness {
public:
    explicit AcmeHarness(HarnessOptions options = {})
        : options_(options)
        , urls(kBaseUrl)
        , state(std::make_shared<repositories::MemoryState>())
        , nonceRepo(state), accountRepo(state), orderRepo(state), authzRepo(state)
        , challengeRepo(state), certRepo(state), crlRepo(state), ocspKeyRepo(state)
    {
        caKey = test_helpers::generateEcKey();
        caCert = test_helpers::createRootCa(caKey.get(), "ACME Harness Root");
        ca = std::make_unique<services::CertificateAuthority>(
            acme::crypto::privateKeyToPem(caKey.get()),
            acme::crypto::certificateToPem(caCert.get()));

        auto clk = clock.clock();

        nonceService = std::make_unique<services::NonceService>(&nonceRepo, 3600, clk);
        authenticator = std::make_unique<services::RequestAuthenticator>(
            nonceService.get(), &accountRepo, urls.accountPrefix());
        accountService = std::make_unique<services::AccountService>(&accountRepo, options.requireContact, clk);

        services::OrderPolicy orderPolicy;
        orderPolicy.orderValiditySeconds = options.orderValiditySeconds;
        orderService = std::make_unique<services::OrderService>(
            &orderRepo, &authzRepo, &challengeRepo, orderPolicy, clk);

        services::ValidationPolicy validation;
        validation.maxAttempts = 3;
        validation.retryBaseMs = 0;
        validation.probeTimeoutSeconds = 1;
        challengeService = std::make_unique<services::ChallengeService>(
            &accountRepo, &authzRepo, &challengeRepo, orderService.get(), &executor,
            &http, &dns, options.withPublisher ? &publisher : nullptr, validation, clk);

        services::IssuancePolicy issuance;
        issuance.ocspResponderUrl = urls.ocsp();
        issuanceService = std::make_unique<services::IssuanceService>(
            &orderRepo, &certRepo, orderService.get(), ca.get(), &executor, issuance, clk);

        revocationService = std::make_unique<services::RevocationService>(&certRepo, ca.get(), clk);
        ocspResponder = std::make_unique<services::OcspResponderService>(
            &certRepo, &ocspKeyRepo, ca.get(), 3600, clk);

        services::HousekeepingPolicy housekeepingPolicy;
        housekeepingPolicy.acmeEnabled = options.acmeEnabled;
        housekeeping = std::make_unique<services::HousekeepingService>(
            &certRepo, &crlRepo, &ocspKeyRepo, &orderRepo, nonceService.get(), &rateLimiter,
            ca.get(), housekeepingPolicy, clk);

        services::ApiDependencies deps;
        deps.nonceService = nonceService.get();
        deps.authenticator = authenticator.get();
        deps.accountService = accountService.get();
        deps.orderService = orderService.get();
        deps.challengeService = challengeService.get();
        deps.issuanceService = issuanceService.get();
        deps.revocationService = revocationService.get();
        deps.ocspResponder = ocspResponder.get();
        deps.crlRepository = &crlRepo;
        deps.ca = ca.get();
        deps.rateLimiter = &rateLimiter;

        services::ApiSettings settings;
        settings.enabled = options.acmeEnabled;
        settings.meta.termsOfService = "https://acme.test/terms";
        settings.newAccountLimits = options.newAccountLimits;
        settings.newOrderLimits = options.newOrderLimits;
        api = std::make_unique<services::AcmeApiService>(deps, urls, settings);
    }

    HarnessOptions options_;
    ManualClock clock;
    common::AcmeUrls urls;

    std::shared_ptr<repositories::MemoryState> state;
    repositories::MemoryNonceRepository nonceRepo;
    repositories::MemoryAccountRepository accountRepo;
    repositories::MemoryOrderRepository orderRepo;
    repositories::MemoryAuthorizationRepository authzRepo;
    repositories::MemoryChallengeRepository challengeRepo;
    repositories::MemoryCertificateRepository certRepo;
    repositories::MemoryCrlRepository crlRepo;
    repositories::MemoryOcspKeyRepository ocspKeyRepo;

    acme::crypto::UniqueKey caKey;
    acme::crypto::UniqueCert caCert;
    std::unique_ptr<services::CertificateAuthority> ca;

    SwitchableExecutor executor;
    FakeHttpFetcher http;
    FakeDnsResolver dns;
    RecordingPublisher publisher;
    middleware::RateLimiter rateLimiter;

    std::unique_ptr<services::NonceService> nonceService;
    std::unique_ptr<services::RequestAuthenticator> authenticator;
    std::unique_ptr<services::AccountService> accountService;
    std::unique_ptr<services::OrderService> orderService;
    std::unique_ptr<services::ChallengeService> challengeService;
    std::unique_ptr<services::IssuanceService> issuanceService;
    std::unique_ptr<services::RevocationService> revocationService;
    std::unique_ptr<services::OcspResponderService> ocspResponder;
    std::unique_ptr<services::HousekeepingService> housekeeping;
    std::unique_ptr<services::AcmeApiService> api;
};

// --- Client ---

/**
 * @brief Minimal ACME client holding one account key
 */
class AcmeTestClient {
public:
    explicit AcmeTestClient(AcmeHarness& harness, acme::crypto::UniqueKey key = test_helpers::generateEcKey())
        : harness_(harness)
        , key_(std::move(key))
        , jwk_(acme::crypto::publicKeyToJwk(key_.get())) {}

    const Json::Value& jwk() const { return jwk_; }
    EVP_PKEY* key() const { return key_.get(); }
    const std::string& kid() const { return kid_; }
    std::string accountId() const { return kid_.substr(harness_.urls.accountPrefix().size()); }

    std::string freshNonce() { return harness_.nonceService->issue(); }

    /// @brief Flattened JWS body; an empty payload makes a POST-as-GET
    std::string sign(const std::string& url, const std::string& payload, bool embedJwk,
                     const std::string& nonce = "") {
        Json::Value header;
        header["alg"] = algorithm();
        header["nonce"] = nonce.empty() ? freshNonce() : nonce;
        header["url"] = url;
        if (embedJwk) {
            header["jwk"] = jwk_;
        } else {
            header["kid"] = kid_;
        }
        return acme::crypto::signFlattenedJws(header, payload, key_.get());
    }

    services::AcmeHttpRequest post(const std::string& url, const Json::Value& payload) {
        return request(sign(url, compactJson(payload), kid_.empty()));
    }

    services::AcmeHttpRequest postWithJwk(const std::string& url, const Json::Value& payload) {
        return request(sign(url, compactJson(payload), true));
    }

    services::AcmeHttpRequest postAsGet(const std::string& url) {
        return request(sign(url, "", false));
    }

    static services::AcmeHttpRequest request(const std::string& body) {
        services::AcmeHttpRequest req;
        req.method = "POST";
        req.contentType = "application/jose+json";
        req.body = body;
        req.clientIp = "192.0.2.10";
        return req;
    }

    // --- Flow helpers ---

    services::AcmeHttpResponse registerAccount(const Json::Value& payload = defaultAccountPayload()) {
        auto response = harness_.api->newAccount(postWithJwk(harness_.urls.newAccount(), payload));
        if (response.status == 200 || response.status == 201) {
            kid_ = response.header("Location");
        }
        return response;
    }

    static Json::Value defaultAccountPayload() {
        Json::Value payload;
        payload["termsOfServiceAgreed"] = true;
        payload["contact"].append("mailto:admin@example.org");
        return payload;
    }

    services::AcmeHttpResponse newOrder(const std::vector<std::string>& names) {
        Json::Value payload;
        for (const auto& name : names) {
            Json::Value identifier;
            identifier["type"] = "dns";
            identifier["value"] = name;
            payload["identifiers"].append(identifier);
        }
        return harness_.api->newOrder(post(harness_.urls.newOrder(), payload));
    }

    /// @brief Id at the end of a resource URL
    static std::string lastSegment(const std::string& url) {
        auto slash = url.rfind('/');
        return slash == std::string::npos ? url : url.substr(slash + 1);
    }

    /// @brief Serve the http-01 response for every authorization and start the challenges
    void solveHttp01(const Json::Value& order) {
        for (const auto& authzUrl : order["authorizations"]) {
            auto authz = parseJson(harness_.api->authorization(
                postAsGet(authzUrl.asString()), lastSegment(authzUrl.asString())).body);
            for (const auto& challenge : authz["challenges"]) {
                if (challenge["type"].asString() != "http-01") continue;
                const std::string token = challenge["token"].asString();
                harness_.http.serve(
                    "http://" + authz["identifier"]["value"].asString() + "/.well-known/acme-challenge/" + token,
                    200, acme::crypto::keyAuthorization(token, jwk_));
                const std::string url = challenge["url"].asString();
                harness_.api->challenge(post(url, Json::Value(Json::objectValue)), lastSegment(url));
            }
        }
    }

    /// @brief Signed finalize request with a CSR for a fresh key
    services::AcmeHttpRequest finalizeRequest(const Json::Value& order, const std::vector<std::string>& csrNames) {
        certKey_ = test_helpers::generateEcKey();
        auto csr = test_helpers::createCsr(certKey_.get(), csrNames.empty() ? "" : csrNames.front(), csrNames);
        Json::Value payload;
        payload["csr"] = acme::crypto::base64UrlEncode(test_helpers::csrToDer(csr.get()));
        return post(order["finalize"].asString(), payload);
    }

    static std::string orderIdOf(const Json::Value& order) {
        const std::string url = order["finalize"].asString();
        return lastSegment(url.substr(0, url.rfind('/')));
    }

    /// @brief Finalize with a fresh key; returns the response
    services::AcmeHttpResponse finalize(const Json::Value& order, const std::vector<std::string>& csrNames) {
        auto request = finalizeRequest(order, csrNames);
        return harness_.api->finalize(request, orderIdOf(order));
    }

    EVP_PKEY* certificateKey() const { return certKey_.get(); }

private:
    std::string algorithm() const {
        return EVP_PKEY_base_id(key_.get()) == EVP_PKEY_RSA ? "RS256" : "ES256";
    }

    AcmeHarness& harness_;
    acme::crypto::UniqueKey key_;
    Json::Value jwk_;
    std::string kid_;
    acme::crypto::UniqueKey certKey_;
};

} // namespace acme_test
