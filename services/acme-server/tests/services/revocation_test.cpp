/**
 * @file revocation_test.cpp
 * @brief Revocation, CRL publication and OCSP tests
 *
 * Covers revoke-cert authorization rules, CRL caching stability and the
 * OCSP responder backed by rotated delegated keys.
 */

#include <gtest/gtest.h>
#include <openssl/ocsp.h>
#include <openssl/x509.h>

#include <acme/crypto/crl_builder.h>
#include "common/exceptions.h"
#include "../test_support.h"

using acme_test::AcmeHarness;
using acme_test::AcmeTestClient;
using acme_test::parseJson;

namespace {

const std::string kProblemPrefix = "urn:ietf:params:acme:error:";

struct OcspResult {
    int responseStatus = -1;
    int certStatus = -1;
    int reason = -1;
};

class RevocationTest : public ::testing::Test {
protected:
    AcmeHarness harness_;
    AcmeTestClient client_{harness_};
    acme::crypto::UniqueCert leaf_;

    void SetUp() override {
        ASSERT_EQ(client_.registerAccount().status, 201);
        leaf_ = issue({"example.org"});
        ASSERT_NE(leaf_, nullptr);
    }

    acme::crypto::UniqueCert issue(const std::vector<std::string>& names) {
        auto order = parseJson(client_.newOrder(names).body);
        client_.solveHttp01(order);
        auto finalized = parseJson(client_.finalize(order, names).body);
        const std::string serial = AcmeTestClient::lastSegment(finalized["certificate"].asString());
        auto stored = harness_.certRepo.findBySerial(serial);
        if (!stored) return nullptr;
        return acme::crypto::certificateFromPem(stored->pem);
    }

    Json::Value revokePayload(X509* cert, int reason = -1) {
        Json::Value payload;
        payload["certificate"] = acme::crypto::base64UrlEncode(acme::crypto::certificateToDer(cert));
        if (reason >= 0) payload["reason"] = reason;
        return payload;
    }

    services::AcmeHttpResponse revokeWithAccount(AcmeTestClient& client, X509* cert, int reason = -1) {
        return harness_.api->revokeCert(client.post(harness_.urls.revokeCert(), revokePayload(cert, reason)));
    }

    services::AcmeHttpResponse revokeWithKey(EVP_PKEY* key, X509* cert, int reason = -1) {
        Json::Value header;
        header["alg"] = "ES256";
        header["jwk"] = acme::crypto::publicKeyToJwk(key);
        header["nonce"] = harness_.nonceService->issue();
        header["url"] = harness_.urls.revokeCert();
        std::string body = acme::crypto::signFlattenedJws(
            header, acme_test::compactJson(revokePayload(cert, reason)), key);
        return harness_.api->revokeCert(AcmeTestClient::request(body));
    }

    std::string serialOf(X509* cert) { return acme::crypto::serialHex(cert); }

    OcspResult queryOcsp(X509* cert) {
        services::AcmeHttpRequest request;
        request.method = "POST";
        request.contentType = "application/ocsp-request";
        request.body = test_helpers::createOcspRequest(cert, harness_.caCert.get());
        auto response = harness_.api->ocsp(request);
        EXPECT_EQ(response.status, 200);
        EXPECT_EQ(response.contentType, "application/ocsp-response");

        OcspResult result;
        const unsigned char* p = reinterpret_cast<const unsigned char*>(response.body.data());
        OCSP_RESPONSE* resp = d2i_OCSP_RESPONSE(nullptr, &p, static_cast<long>(response.body.size()));
        if (!resp) return result;
        result.responseStatus = OCSP_response_status(resp);

        if (result.responseStatus == OCSP_RESPONSE_STATUS_SUCCESSFUL) {
            OCSP_BASICRESP* basic = OCSP_response_get1_basic(resp);
            OCSP_CERTID* id = OCSP_cert_to_id(EVP_sha1(), cert, harness_.caCert.get());
            int status = -1;
            int reason = -1;
            ASN1_GENERALIZEDTIME* revokedAt = nullptr;
            ASN1_GENERALIZEDTIME* thisUpdate = nullptr;
            ASN1_GENERALIZEDTIME* nextUpdate = nullptr;
            if (OCSP_resp_find_status(basic, id, &status, &reason, &revokedAt, &thisUpdate, &nextUpdate)) {
                result.certStatus = status;
                result.reason = reason;
            }
            OCSP_CERTID_free(id);
            OCSP_BASICRESP_free(basic);
        }
        OCSP_RESPONSE_free(resp);
        return result;
    }

    bool crlListsSerial(const std::string& der, const std::string& serial) {
        auto crl = acme::crypto::crlFromDer(der);
        if (!crl) return false;
        STACK_OF(X509_REVOKED)* revoked = X509_CRL_get_REVOKED(crl.get());
        for (int i = 0; i < sk_X509_REVOKED_num(revoked); ++i) {
            const ASN1_INTEGER* s = X509_REVOKED_get0_serialNumber(sk_X509_REVOKED_value(revoked, i));
            BIGNUM* bn = ASN1_INTEGER_to_BN(s, nullptr);
            char* hex = BN_bn2hex(bn);
            bool match = serial == hex;
            OPENSSL_free(hex);
            BN_free(bn);
            if (match) return true;
        }
        return false;
    }
};

// --- Revoke Tests ---

TEST_F(RevocationTest, OwnerAccountRevokesCertificate) {
    // Act
    auto response = revokeWithAccount(client_, leaf_.get(), 1);

    // Assert
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.body.empty());
    auto stored = harness_.certRepo.findBySerial(serialOf(leaf_.get()));
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->revoked);
    EXPECT_EQ(stored->revocationReason.value_or(-1), 1);
    EXPECT_EQ(stored->revokedAt.value_or(0), harness_.clock.now());
}

TEST_F(RevocationTest, CertificateKeyRevokesWithoutAccount) {
    auto response = revokeWithKey(client_.certificateKey(), leaf_.get());

    EXPECT_EQ(response.status, 200) << response.body;
    EXPECT_TRUE(harness_.certRepo.findBySerial(serialOf(leaf_.get()))->revoked);
}

TEST_F(RevocationTest, UnrelatedKeyCannotRevoke) {
    auto stranger = test_helpers::generateEcKey();

    auto response = revokeWithKey(stranger.get(), leaf_.get());

    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "unauthorized");
    EXPECT_FALSE(harness_.certRepo.findBySerial(serialOf(leaf_.get()))->revoked);
}

TEST_F(RevocationTest, OtherAccountCannotRevoke) {
    AcmeTestClient other(harness_);
    other.registerAccount();

    auto response = revokeWithAccount(other, leaf_.get());

    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "unauthorized");
}

TEST_F(RevocationTest, SecondRevocationIsAlreadyRevoked) {
    ASSERT_EQ(revokeWithAccount(client_, leaf_.get(), 4).status, 200);

    auto response = revokeWithAccount(client_, leaf_.get(), 1);

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "alreadyRevoked");
    auto stored = harness_.certRepo.findBySerial(serialOf(leaf_.get()));
    EXPECT_EQ(stored->revocationReason.value_or(-1), 4);
}

TEST_F(RevocationTest, RepositoryNeverUnrevokes) {
    const std::string serial = serialOf(leaf_.get());
    ASSERT_TRUE(harness_.certRepo.revoke(serial, 1, harness_.clock.now()));

    EXPECT_FALSE(harness_.certRepo.revoke(serial, 0, harness_.clock.now() + 10));
    auto stored = harness_.certRepo.findBySerial(serial);
    EXPECT_TRUE(stored->revoked);
    EXPECT_EQ(stored->revocationReason.value_or(-1), 1);
    EXPECT_EQ(stored->revokedAt.value_or(0), harness_.clock.now());
}

TEST_F(RevocationTest, DisallowedReasonIsRejected) {
    for (int reason : {2, 7, 8, 10, 11}) {
        auto response = revokeWithAccount(client_, leaf_.get(), reason);
        EXPECT_EQ(response.status, 400) << reason;
        EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "badRevocationReason") << reason;
    }
    EXPECT_FALSE(harness_.certRepo.findBySerial(serialOf(leaf_.get()))->revoked);
}

TEST_F(RevocationTest, ForeignCertificateIsUnauthorized) {
    auto otherCaKey = test_helpers::generateEcKey();
    auto otherCa = test_helpers::createRootCa(otherCaKey.get(), "Foreign Root");
    auto subjectKey = test_helpers::generateEcKey();
    acme::crypto::LeafCertificateRequest req;
    req.subjectKey = subjectKey.get();
    req.commonName = "example.org";
    req.dnsNames = {"example.org"};
    req.serialHex = serialOf(leaf_.get());
    req.notBefore = harness_.clock.now();
    req.notAfter = req.notBefore + 86400;
    auto forged = acme::crypto::signLeafCertificate(req, otherCa.get(), otherCaKey.get());

    auto response = revokeWithKey(subjectKey.get(), forged.get());

    EXPECT_EQ(response.status, 403);
    EXPECT_FALSE(harness_.certRepo.findBySerial(serialOf(leaf_.get()))->revoked);
}

TEST_F(RevocationTest, MissingCertificateIsMalformed) {
    Json::Value payload;
    payload["reason"] = 1;

    auto response = harness_.api->revokeCert(client_.post(harness_.urls.revokeCert(), payload));

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJson(response.body)["type"].asString(), kProblemPrefix + "malformed");
}

// --- CRL Tests ---

TEST_F(RevocationTest, CrlIsNotFoundBeforeFirstGeneration) {
    auto response = harness_.api->crl();

    EXPECT_EQ(response.status, 404);
}

TEST_F(RevocationTest, CrlIsByteIdenticalWhileNothingChanges) {
    auto first = harness_.housekeeping->cacheCrls();
    EXPECT_TRUE(first.changed);
    auto initial = harness_.api->crl();
    ASSERT_EQ(initial.status, 200);
    EXPECT_EQ(initial.contentType, "application/pkix-crl");

    harness_.clock.advance(600);
    auto second = harness_.housekeeping->cacheCrls();

    EXPECT_FALSE(second.changed);
    EXPECT_EQ(harness_.api->crl().body, initial.body);
}

TEST_F(RevocationTest, CrlListsRevokedCertificateWithNewNumber) {
    harness_.housekeeping->cacheCrls();
    auto before = harness_.crlRepo.findLatest(harness_.ca->serial());
    ASSERT_TRUE(before.has_value());
    EXPECT_FALSE(crlListsSerial(before->der, serialOf(leaf_.get())));

    ASSERT_EQ(revokeWithAccount(client_, leaf_.get(), 1).status, 200);
    auto result = harness_.housekeeping->cacheCrls();

    EXPECT_TRUE(result.changed);
    auto after = harness_.crlRepo.findLatest(harness_.ca->serial());
    EXPECT_GT(after->crlNumber, before->crlNumber);
    EXPECT_TRUE(crlListsSerial(after->der, serialOf(leaf_.get())));

    auto crl = acme::crypto::crlFromDer(after->der);
    ASSERT_NE(crl, nullptr);
    EXPECT_EQ(X509_CRL_verify(crl.get(), harness_.caKey.get()), 1);
}

TEST_F(RevocationTest, CrlIsRefreshedNearNextUpdate) {
    harness_.housekeeping->cacheCrls();
    auto before = harness_.crlRepo.findLatest(harness_.ca->serial());

    harness_.clock.advance(24 * 3600 - 1800);
    auto result = harness_.housekeeping->cacheCrls();

    EXPECT_TRUE(result.changed);
    auto after = harness_.crlRepo.findLatest(harness_.ca->serial());
    EXPECT_GT(after->nextUpdate, before->nextUpdate);
}

TEST_F(RevocationTest, CrlOmitsExpiredRevokedCertificates) {
    ASSERT_EQ(revokeWithAccount(client_, leaf_.get(), 1).status, 200);
    harness_.clock.advance(91L * 86400);

    harness_.housekeeping->cacheCrls();

    auto latest = harness_.crlRepo.findLatest(harness_.ca->serial());
    EXPECT_FALSE(crlListsSerial(latest->der, serialOf(leaf_.get())));
}

// --- OCSP Tests ---

TEST_F(RevocationTest, OcspWithoutResponderKeyIsTryLater) {
    auto result = queryOcsp(leaf_.get());

    EXPECT_EQ(result.responseStatus, OCSP_RESPONSE_STATUS_TRYLATER);
}

TEST_F(RevocationTest, OcspReportsGoodThenRevoked) {
    harness_.housekeeping->generateOcspKeys();

    auto good = queryOcsp(leaf_.get());
    EXPECT_EQ(good.responseStatus, OCSP_RESPONSE_STATUS_SUCCESSFUL);
    EXPECT_EQ(good.certStatus, V_OCSP_CERTSTATUS_GOOD);

    ASSERT_EQ(revokeWithAccount(client_, leaf_.get(), 1).status, 200);

    auto revoked = queryOcsp(leaf_.get());
    EXPECT_EQ(revoked.certStatus, V_OCSP_CERTSTATUS_REVOKED);
    EXPECT_EQ(revoked.reason, 1);
}

TEST_F(RevocationTest, OcspUnknownSerialIsUnknown) {
    harness_.housekeeping->generateOcspKeys();
    auto subjectKey = test_helpers::generateEcKey();
    acme::crypto::LeafCertificateRequest req;
    req.subjectKey = subjectKey.get();
    req.commonName = "never-stored.example.org";
    req.dnsNames = {"never-stored.example.org"};
    req.serialHex = acme::crypto::generateSerialHex();
    req.notBefore = harness_.clock.now();
    req.notAfter = req.notBefore + 86400;
    auto unstored = acme::crypto::signLeafCertificate(req, harness_.caCert.get(), harness_.caKey.get());

    auto result = queryOcsp(unstored.get());

    EXPECT_EQ(result.responseStatus, OCSP_RESPONSE_STATUS_SUCCESSFUL);
    EXPECT_EQ(result.certStatus, V_OCSP_CERTSTATUS_UNKNOWN);
}

TEST_F(RevocationTest, OcspRequiresOcspContentType) {
    services::AcmeHttpRequest request;
    request.method = "POST";
    request.contentType = "application/json";
    request.body = test_helpers::createOcspRequest(leaf_.get(), harness_.caCert.get());

    auto response = harness_.api->ocsp(request);

    EXPECT_EQ(response.status, 415);
}

} // anonymous namespace
