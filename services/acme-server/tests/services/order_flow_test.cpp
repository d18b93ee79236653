/**
 * @file order_flow_test.cpp
 * @brief Order lifecycle tests: creation, challenge validation, finalize, download
 *
 * Drives OrderService, ChallengeService and IssuanceService through the API
 * surface with fake http-01 / dns-01 probes.
 */

#include <gtest/gtest.h>
#include <openssl/x509v3.h>
#include <atomic>
#include <thread>

#include "common/exceptions.h"
#include "../test_support.h"

using acme_test::AcmeHarness;
using acme_test::AcmeTestClient;
using acme_test::parseJson;

namespace {

const std::string kProblemPrefix = "urn:ietf:params:acme:error:";

class OrderFlowTest : public ::testing::Test {
protected:
    AcmeHarness harness_;
    AcmeTestClient client_{harness_};

    void SetUp() override {
        ASSERT_EQ(client_.registerAccount().status, 201);
    }

    Json::Value createOrder(const std::vector<std::string>& names) {
        auto response = client_.newOrder(names);
        EXPECT_EQ(response.status, 201) << response.body;
        orderUrl_ = response.header("Location");
        return parseJson(response.body);
    }

    Json::Value fetchOrder() {
        return parseJson(harness_.api->order(
            client_.postAsGet(orderUrl_), AcmeTestClient::lastSegment(orderUrl_)).body);
    }

    Json::Value fetchAuthorization(const std::string& url) {
        return parseJson(harness_.api->authorization(
            client_.postAsGet(url), AcmeTestClient::lastSegment(url)).body);
    }

    Json::Value challengeOfType(const Json::Value& authz, const std::string& type) {
        for (const auto& ch : authz["challenges"]) {
            if (ch["type"].asString() == type) return ch;
        }
        return Json::nullValue;
    }

    services::AcmeHttpResponse startChallenge(const Json::Value& challenge) {
        const std::string url = challenge["url"].asString();
        return harness_.api->challenge(
            client_.post(url, Json::Value(Json::objectValue)), AcmeTestClient::lastSegment(url));
    }

    std::string http01Url(const std::string& name, const std::string& token) {
        return "http://" + name + "/.well-known/acme-challenge/" + token;
    }

    Json::Value readyOrder(const std::vector<std::string>& names) {
        auto order = createOrder(names);
        client_.solveHttp01(order);
        auto current = fetchOrder();
        EXPECT_EQ(current["status"].asString(), "ready");
        return current;
    }

    std::string orderUrl_;
};

// --- New Order Tests ---

TEST_F(OrderFlowTest, NewOrderIsPendingWithAuthorizationPerName) {
    // Act
    auto order = createOrder({"www.example.org", "EXAMPLE.org", "www.example.org"});

    // Assert
    EXPECT_EQ(order["status"].asString(), "pending");
    ASSERT_EQ(order["identifiers"].size(), 2u);
    EXPECT_EQ(order["identifiers"][0]["type"].asString(), "dns");
    EXPECT_EQ(order["identifiers"][1]["value"].asString(), "example.org");
    EXPECT_EQ(order["authorizations"].size(), 2u);
    EXPECT_EQ(order["finalize"].asString(), orderUrl_ + "/finalize");
    EXPECT_FALSE(order.isMember("certificate"));

    auto authz = fetchAuthorization(order["authorizations"][0].asString());
    EXPECT_EQ(authz["status"].asString(), "pending");
    ASSERT_EQ(authz["challenges"].size(), 2u);
    EXPECT_FALSE(challengeOfType(authz, "http-01").isNull());
    EXPECT_FALSE(challengeOfType(authz, "dns-01").isNull());
    EXPECT_EQ(challengeOfType(authz, "http-01")["status"].asString(), "pending");
}

TEST_F(OrderFlowTest, NewOrderRejectsBadIdentifiers) {
    struct Case { std::vector<std::string> names; const char* problem; };
    std::vector<Case> cases = {
        {{"*.example.org"}, "rejectedIdentifier"},
        {{"bad_name.example.org"}, "rejectedIdentifier"},
        {{"192.0.2.1"}, "rejectedIdentifier"},
        {{}, "malformed"},
    };

    for (const auto& c : cases) {
        auto response = client_.newOrder(c.names);
        EXPECT_EQ(response.status, 400) << c.problem;
        EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + c.problem);
    }
}

TEST_F(OrderFlowTest, NewOrderRejectsNonDnsIdentifierType) {
    Json::Value payload;
    Json::Value identifier;
    identifier["type"] = "ip";
    identifier["value"] = "192.0.2.1";
    payload["identifiers"].append(identifier);

    auto response = harness_.api->newOrder(client_.post(harness_.urls.newOrder(), payload));

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "unsupportedIdentifier");
}

TEST_F(OrderFlowTest, NewOrderRejectsNotBeforeInThePast) {
    Json::Value payload;
    Json::Value identifier;
    identifier["type"] = "dns";
    identifier["value"] = "example.org";
    payload["identifiers"].append(identifier);
    payload["notBefore"] = acme::crypto::formatRfc3339(harness_.clock.now() - 3600);

    auto response = harness_.api->newOrder(client_.post(harness_.urls.newOrder(), payload));

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "malformed");
}

TEST_F(OrderFlowTest, OrderOfAnotherAccountIsUnauthorized) {
    createOrder({"example.org"});
    AcmeTestClient intruder(harness_);
    intruder.registerAccount();

    auto response = harness_.api->order(
        intruder.postAsGet(orderUrl_), AcmeTestClient::lastSegment(orderUrl_));

    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "unauthorized");
}

TEST_F(OrderFlowTest, AccountOrdersListsOrderUrls) {
    createOrder({"a.example.org"});
    std::string first = orderUrl_;
    createOrder({"b.example.org"});

    auto response = harness_.api->accountOrders(
        client_.postAsGet(harness_.urls.accountOrders(client_.accountId())), client_.accountId());

    ASSERT_EQ(response.status, 200);
    auto orders = parseJson(response.body)["orders"];
    ASSERT_EQ(orders.size(), 2u);
    bool found = false;
    for (const auto& url : orders) {
        if (url.asString() == first) found = true;
    }
    EXPECT_TRUE(found);
}

// --- Challenge Tests ---

TEST_F(OrderFlowTest, Http01ValidatesAuthorizationAndReadiesOrder) {
    auto order = createOrder({"example.org", "www.example.org"});

    client_.solveHttp01(order);

    auto current = fetchOrder();
    EXPECT_EQ(current["status"].asString(), "ready");
    for (const auto& url : current["authorizations"]) {
        auto authz = fetchAuthorization(url.asString());
        EXPECT_EQ(authz["status"].asString(), "valid");
        ASSERT_EQ(authz["challenges"].size(), 1u);
        EXPECT_EQ(authz["challenges"][0]["type"].asString(), "http-01");
        EXPECT_EQ(authz["challenges"][0]["status"].asString(), "valid");
        EXPECT_TRUE(authz["challenges"][0].isMember("validated"));
    }
}

TEST_F(OrderFlowTest, ChallengeResponseCarriesUpLink) {
    auto order = createOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    auto challenge = challengeOfType(fetchAuthorization(authzUrl), "http-01");

    auto response = startChallenge(challenge);

    EXPECT_EQ(response.header("Link"), "<" + authzUrl + ">;rel=\"up\"");
}

TEST_F(OrderFlowTest, Http01WrongBodyInvalidatesChallengeAuthorizationAndOrder) {
    // Arrange
    auto order = createOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    auto challenge = challengeOfType(fetchAuthorization(authzUrl), "http-01");
    harness_.http.serve(http01Url("example.org", challenge["token"].asString()), 200, "not-the-key-authorization");

    // Act
    auto response = startChallenge(challenge);

    // Assert
    auto result = parseJson(response.body);
    EXPECT_EQ(result["status"].asString(), "invalid");
    EXPECT_EQ(result["error"]["type"].asString(), kProblemPrefix + "incorrectResponse");
    EXPECT_EQ(fetchAuthorization(authzUrl)["status"].asString(), "invalid");

    auto current = fetchOrder();
    EXPECT_EQ(current["status"].asString(), "invalid");
    EXPECT_TRUE(current.isMember("error"));
}

TEST_F(OrderFlowTest, Http01ConnectionFailureIsRetriedThenFails) {
    auto order = createOrder({"unreachable.example.org"});
    auto challenge = challengeOfType(fetchAuthorization(order["authorizations"][0].asString()), "http-01");
    const std::string url = http01Url("unreachable.example.org", challenge["token"].asString());

    auto result = parseJson(startChallenge(challenge).body);

    EXPECT_EQ(harness_.http.requestCount(url), 3u);
    EXPECT_EQ(result["status"].asString(), "invalid");
    EXPECT_EQ(result["error"]["type"].asString(), kProblemPrefix + "connection");
}

TEST_F(OrderFlowTest, Http01WrongStatusIsNotRetried) {
    auto order = createOrder({"example.org"});
    auto challenge = challengeOfType(fetchAuthorization(order["authorizations"][0].asString()), "http-01");
    const std::string url = http01Url("example.org", challenge["token"].asString());
    harness_.http.serve(url, 404, "");

    auto result = parseJson(startChallenge(challenge).body);

    EXPECT_EQ(harness_.http.requestCount(url), 1u);
    EXPECT_EQ(result["error"]["type"].asString(), kProblemPrefix + "incorrectResponse");
}

TEST_F(OrderFlowTest, Dns01ValidatesWithTxtDigest) {
    auto order = createOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    auto challenge = challengeOfType(fetchAuthorization(authzUrl), "dns-01");
    std::string keyAuth = acme::crypto::keyAuthorization(challenge["token"].asString(), client_.jwk());
    harness_.dns.setTxt("_acme-challenge.example.org",
        {"unrelated", acme::crypto::base64UrlEncode(acme::crypto::sha256(keyAuth))});

    auto result = parseJson(startChallenge(challenge).body);

    EXPECT_EQ(result["status"].asString(), "valid");
    EXPECT_EQ(fetchAuthorization(authzUrl)["status"].asString(), "valid");
    EXPECT_EQ(fetchOrder()["status"].asString(), "ready");
}

TEST_F(OrderFlowTest, Dns01MissingRecordIsIncorrectResponse) {
    auto order = createOrder({"example.org"});
    auto challenge = challengeOfType(fetchAuthorization(order["authorizations"][0].asString()), "dns-01");
    harness_.dns.setTxt("_acme-challenge.example.org", {"stale-value"});

    auto result = parseJson(startChallenge(challenge).body);

    EXPECT_EQ(result["status"].asString(), "invalid");
    EXPECT_EQ(result["error"]["type"].asString(), kProblemPrefix + "incorrectResponse");
    EXPECT_EQ(harness_.dns.queries(), 1);
}

TEST_F(OrderFlowTest, RespondingTwiceDoesNotRevalidate) {
    auto order = createOrder({"example.org"});
    auto challenge = challengeOfType(fetchAuthorization(order["authorizations"][0].asString()), "http-01");
    const std::string url = http01Url("example.org", challenge["token"].asString());
    harness_.http.serve(url, 200, acme::crypto::keyAuthorization(challenge["token"].asString(), client_.jwk()));

    startChallenge(challenge);
    auto again = parseJson(startChallenge(challenge).body);

    EXPECT_EQ(again["status"].asString(), "valid");
    EXPECT_EQ(harness_.http.requestCount(url), 1u);
}

TEST_F(OrderFlowTest, OnlyOneChallengePerAuthorizationIsStarted) {
    // Arrange
    harness_.executor.deferred = true;
    auto order = createOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    auto authz = fetchAuthorization(authzUrl);
    auto dns = challengeOfType(authz, "dns-01");
    auto http = challengeOfType(authz, "http-01");
    std::string keyAuth = acme::crypto::keyAuthorization(dns["token"].asString(), client_.jwk());
    harness_.dns.setTxt("_acme-challenge.example.org", {acme::crypto::base64UrlEncode(acme::crypto::sha256(keyAuth))});

    // Act
    auto first = parseJson(startChallenge(dns).body);
    auto second = parseJson(startChallenge(http).body);

    // Assert
    EXPECT_EQ(first["status"].asString(), "processing");
    EXPECT_EQ(second["status"].asString(), "pending");
    EXPECT_EQ(harness_.executor.deferredExecutor.pending(), 1u);

    harness_.executor.deferredExecutor.runAll();
    EXPECT_EQ(fetchAuthorization(authzUrl)["status"].asString(), "valid");
    EXPECT_EQ(fetchOrder()["status"].asString(), "ready");
}

TEST_F(OrderFlowTest, ChallengeOfValidatedAuthorizationIsNotStarted) {
    auto order = createOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    auto dns = challengeOfType(fetchAuthorization(authzUrl), "dns-01");
    client_.solveHttp01(order);
    ASSERT_EQ(fetchAuthorization(authzUrl)["status"].asString(), "valid");

    const std::string dnsId = AcmeTestClient::lastSegment(dns["url"].asString());
    EXPECT_FALSE(harness_.challengeRepo.startProcessing(dnsId));
    EXPECT_EQ(harness_.challengeRepo.findById(dnsId)->status, domain::models::ChallengeStatus::PENDING);
}

TEST_F(OrderFlowTest, ChallengeIsProcessingUntilValidationRuns) {
    harness_.executor.deferred = true;
    auto order = createOrder({"example.org"});
    auto challenge = challengeOfType(fetchAuthorization(order["authorizations"][0].asString()), "http-01");
    harness_.http.serve(http01Url("example.org", challenge["token"].asString()), 200,
        acme::crypto::keyAuthorization(challenge["token"].asString(), client_.jwk()));

    auto started = parseJson(startChallenge(challenge).body);
    EXPECT_EQ(started["status"].asString(), "processing");
    EXPECT_EQ(harness_.executor.deferredExecutor.pending(), 1u);

    harness_.executor.deferredExecutor.runAll();
    EXPECT_EQ(fetchOrder()["status"].asString(), "ready");
}

TEST_F(OrderFlowTest, FullValidationQueueFailsChallenge) {
    harness_.executor.inlineExecutor.accepting = false;
    auto order = createOrder({"example.org"});
    auto challenge = challengeOfType(fetchAuthorization(order["authorizations"][0].asString()), "http-01");

    auto result = parseJson(startChallenge(challenge).body);

    EXPECT_EQ(result["status"].asString(), "invalid");
    EXPECT_EQ(result["error"]["type"].asString(), kProblemPrefix + "serverInternal");
}

TEST_F(OrderFlowTest, PublisherServesAndWithdrawsHttp01Response) {
    acme_test::HarnessOptions options;
    options.withPublisher = true;
    AcmeHarness harness(options);
    AcmeTestClient client(harness);
    client.registerAccount();
    auto order = parseJson(client.newOrder({"example.org"}).body);

    client.solveHttp01(order);

    ASSERT_EQ(harness.publisher.withdrawn.size(), 1u);
    EXPECT_TRUE(harness.publisher.published.empty());
}

// --- Authorization Tests ---

TEST_F(OrderFlowTest, DeactivatingAuthorizationInvalidatesOrder) {
    auto order = createOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    Json::Value payload;
    payload["status"] = "deactivated";

    auto response = harness_.api->authorization(
        client_.post(authzUrl, payload), AcmeTestClient::lastSegment(authzUrl));

    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(parseJson(response.body)["status"].asString(), "deactivated");
    EXPECT_EQ(fetchOrder()["status"].asString(), "invalid");
}

TEST_F(OrderFlowTest, AuthorizationRejectsOtherStatusUpdates) {
    auto order = createOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    Json::Value payload;
    payload["status"] = "valid";

    auto response = harness_.api->authorization(
        client_.post(authzUrl, payload), AcmeTestClient::lastSegment(authzUrl));

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "malformed");
}

TEST_F(OrderFlowTest, ExpiredOrderBecomesInvalid) {
    auto order = createOrder({"example.org"});
    harness_.clock.advance(3601);

    auto current = fetchOrder();

    EXPECT_EQ(current["status"].asString(), "invalid");
    EXPECT_EQ(fetchAuthorization(order["authorizations"][0].asString())["status"].asString(), "expired");
}

// --- Finalize Tests ---

TEST_F(OrderFlowTest, FinalizeBeforeReadyIsOrderNotReady) {
    auto order = createOrder({"example.org"});

    auto response = client_.finalize(order, {"example.org"});

    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "orderNotReady");
    EXPECT_EQ(fetchOrder()["status"].asString(), "pending");
}

TEST_F(OrderFlowTest, FinalizeIssuesCertificateForOrderNames) {
    // Arrange
    auto order = readyOrder({"example.org", "www.example.org"});

    // Act
    auto response = client_.finalize(order, {"www.example.org", "example.org"});

    // Assert
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(response.header("Location"), orderUrl_);
    auto finalized = parseJson(response.body);
    EXPECT_EQ(finalized["status"].asString(), "valid");
    ASSERT_TRUE(finalized.isMember("certificate"));

    const std::string certUrl = finalized["certificate"].asString();
    services::AcmeHttpRequest get;
    get.method = "GET";
    auto download = harness_.api->certificate(get, AcmeTestClient::lastSegment(certUrl));
    ASSERT_EQ(download.status, 200);
    EXPECT_EQ(download.contentType, "application/pem-certificate-chain");

    auto chain = acme::crypto::certificatesFromPemBundle(download.body);
    ASSERT_EQ(chain.size(), 2u);
    X509* leaf = chain[0].get();
    EXPECT_EQ(X509_check_host(leaf, "example.org", 0, 0, nullptr), 1);
    EXPECT_EQ(X509_check_host(leaf, "www.example.org", 0, 0, nullptr), 1);
    EXPECT_EQ(X509_verify(leaf, harness_.caKey.get()), 1);
    EXPECT_TRUE(acme::crypto::samePublicKey(leaf, client_.certificateKey()));
    EXPECT_EQ(X509_cmp(chain[1].get(), harness_.caCert.get()), 0);
    EXPECT_EQ(acme::crypto::serialHex(leaf), AcmeTestClient::lastSegment(certUrl));
}

TEST_F(OrderFlowTest, CertificateDownloadAcceptsPostAsGet) {
    auto order = readyOrder({"example.org"});
    auto finalized = parseJson(client_.finalize(order, {"example.org"}).body);
    const std::string certUrl = finalized["certificate"].asString();

    auto download = harness_.api->certificate(client_.postAsGet(certUrl), AcmeTestClient::lastSegment(certUrl));

    EXPECT_EQ(download.status, 200);
    EXPECT_FALSE(download.header("Replay-Nonce").empty());
}

TEST_F(OrderFlowTest, FinalizeAgainReturnsTheIssuedOrder) {
    auto order = readyOrder({"example.org"});
    auto first = parseJson(client_.finalize(order, {"example.org"}).body);

    auto second = client_.finalize(order, {"example.org"});

    ASSERT_EQ(second.status, 200);
    EXPECT_EQ(parseJson(second.body)["certificate"].asString(), first["certificate"].asString());
}

TEST_F(OrderFlowTest, FinalizeWithMismatchedCsrInvalidatesOrder) {
    auto order = readyOrder({"example.org"});

    auto response = client_.finalize(order, {"example.org", "other.example.org"});

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "badCSR");
    auto current = fetchOrder();
    EXPECT_EQ(current["status"].asString(), "invalid");
    EXPECT_EQ(current["error"]["type"].asString(), kProblemPrefix + "badCSR");

    auto retry = client_.finalize(order, {"example.org"});
    EXPECT_EQ(retry.status, 403);
    EXPECT_EQ(parseJson(retry.body)["type"].asString(), kProblemPrefix + "orderNotReady");
}

TEST_F(OrderFlowTest, ReadyOrderWithDeactivatedAuthorizationCannotBeFinalized) {
    // Arrange
    auto order = readyOrder({"example.org"});
    const std::string authzUrl = order["authorizations"][0].asString();
    Json::Value deactivate;
    deactivate["status"] = "deactivated";
    auto response = harness_.api->authorization(
        client_.post(authzUrl, deactivate), AcmeTestClient::lastSegment(authzUrl));
    ASSERT_EQ(parseJson(response.body)["status"].asString(), "deactivated");

    // Act
    auto finalized = client_.finalize(order, {"example.org"});

    // Assert
    EXPECT_EQ(finalized.status, 403);
    EXPECT_EQ(parseJson(finalized.body)["type"].asString(), kProblemPrefix + "orderNotReady");
    EXPECT_EQ(fetchOrder()["status"].asString(), "invalid");
    EXPECT_TRUE(harness_.state->certificates.empty());
}

TEST_F(OrderFlowTest, FinalizeRechecksAuthorizationsAtTransition) {
    auto order = readyOrder({"example.org"});
    const std::string orderId = AcmeTestClient::orderIdOf(order);
    const std::string authzId = AcmeTestClient::lastSegment(order["authorizations"][0].asString());

    // Authorization lost without the order being told
    ASSERT_TRUE(harness_.authzRepo.transition(authzId,
        domain::models::AuthorizationStatus::VALID, domain::models::AuthorizationStatus::REVOKED));

    EXPECT_FALSE(harness_.orderRepo.startProcessing(orderId, harness_.clock.now()));
    auto finalized = client_.finalize(order, {"example.org"});
    EXPECT_EQ(finalized.status, 403);
    EXPECT_NE(fetchOrder()["status"].asString(), "valid");
}

TEST_F(OrderFlowTest, FinalizeRejectsOrderPastAuthorizationExpiry) {
    auto order = readyOrder({"example.org"});
    const std::string orderId = AcmeTestClient::orderIdOf(order);

    EXPECT_FALSE(harness_.orderRepo.startProcessing(orderId, harness_.clock.now() + 3601));

    harness_.clock.advance(3601);
    auto finalized = client_.finalize(order, {"example.org"});
    EXPECT_EQ(finalized.status, 403);
    EXPECT_EQ(fetchOrder()["status"].asString(), "invalid");
}

TEST_F(OrderFlowTest, ConcurrentFinalizeIssuesExactlyOnce) {
    // Arrange
    auto order = readyOrder({"example.org"});
    harness_.executor.deferred = true;
    const std::string orderId = AcmeTestClient::orderIdOf(order);
    std::vector<services::AcmeHttpRequest> requests;
    for (int i = 0; i < 8; ++i) {
        requests.push_back(client_.finalizeRequest(order, {"example.org"}));
    }

    // Act
    std::atomic<int> processing{0};
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    for (size_t i = 0; i < requests.size(); ++i) {
        threads.emplace_back([&, i] {
            auto response = harness_.api->finalize(requests[i], orderId);
            if (response.status == 200 && parseJson(response.body)["status"].asString() == "processing") {
                ++processing;
            } else if (response.status != 403) {
                ++failed;
            }
        });
    }
    for (auto& t : threads) t.join();

    // Assert
    EXPECT_EQ(failed.load(), 0);
    EXPECT_GE(processing.load(), 1);
    EXPECT_EQ(harness_.executor.deferredExecutor.pending(), 1u);

    harness_.executor.deferredExecutor.runAll();
    EXPECT_EQ(fetchOrder()["status"].asString(), "valid");
    EXPECT_EQ(harness_.state->certificates.size(), 1u);
}

TEST_F(OrderFlowTest, FinalizeWithUnparseableCsrIsBadCsr) {
    auto order = readyOrder({"example.org"});
    Json::Value payload;
    payload["csr"] = acme::crypto::base64UrlEncode(std::string("not a certificate request"));
    const std::string url = order["finalize"].asString();

    auto response = harness_.api->finalize(client_.post(url, payload), AcmeTestClient::lastSegment(orderUrl_));

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "badCSR");
}

TEST_F(OrderFlowTest, FinalizeWithWeakKeyIsBadPublicKey) {
    auto order = readyOrder({"example.org"});
    auto weakKey = test_helpers::generateRsaKey(1024);
    auto csr = test_helpers::createCsr(weakKey.get(), "example.org", {"example.org"});
    Json::Value payload;
    payload["csr"] = acme::crypto::base64UrlEncode(test_helpers::csrToDer(csr.get()));

    auto response = harness_.api->finalize(
        client_.post(order["finalize"].asString(), payload), AcmeTestClient::lastSegment(orderUrl_));

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "badPublicKey");
}

TEST_F(OrderFlowTest, FinalizeReportsProcessingWithRetryAfter) {
    auto order = readyOrder({"example.org"});
    harness_.executor.deferred = true;

    auto response = client_.finalize(order, {"example.org"});

    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(parseJson(response.body)["status"].asString(), "processing");
    EXPECT_EQ(response.header("Retry-After"), "1");

    harness_.executor.deferredExecutor.runAll();
    EXPECT_EQ(fetchOrder()["status"].asString(), "valid");
}

TEST_F(OrderFlowTest, UnknownCertificateIsNotFound) {
    services::AcmeHttpRequest get;
    get.method = "GET";

    auto response = harness_.api->certificate(get, "0123456789ABCDEF");

    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "notFound");
}

} // anonymous namespace
