/**
 * @file test_csr_cert.cpp
 * @brief Unit tests for CSR checks and leaf/responder certificate signing
 */

#include <gtest/gtest.h>
#include <acme/crypto/csr.h>
#include <acme/crypto/cert_ops.h>
#include "test_helpers.h"

#include <set>

using namespace acme::crypto;
using namespace test_helpers;

// ============================================================================
// CSR parsing and names
// ============================================================================

TEST(CsrTest, Parse_ValidDer) {
    auto key = generateEcKey();
    auto csr = createCsr(key.get(), "a.example.com", {"a.example.com", "b.example.com"});
    auto parsed = parseCsrDer(csrToDer(csr.get()));
    ASSERT_NE(parsed, nullptr);
    EXPECT_TRUE(verifyCsrSignature(parsed.get()));
}

TEST(CsrTest, Parse_GarbageReturnsNull) {
    EXPECT_EQ(parseCsrDer("not a csr"), nullptr);
    EXPECT_EQ(parseCsrDer(""), nullptr);
}

TEST(CsrTest, Signature_TamperedFails) {
    auto key = generateEcKey();
    auto csr = createCsr(key.get(), "a.example.com", {"a.example.com"});
    std::string der = csrToDer(csr.get());
    der[der.size() - 5] ^= 0x01;  // inside the signature BIT STRING
    auto parsed = parseCsrDer(der);
    if (parsed) {
        EXPECT_FALSE(verifyCsrSignature(parsed.get()));
    }
}

TEST(CsrTest, ExtractNames_CnAndSans) {
    auto key = generateEcKey();
    auto csr = createCsr(key.get(), "A.Example.com", {"b.example.com", "a.example.com"});
    CsrInfo info = extractCsrNames(csr.get());
    EXPECT_EQ(info.commonName, "A.Example.com");
    ASSERT_EQ(info.dnsNames.size(), 2u);
    EXPECT_EQ(info.dnsNames[0], "b.example.com");

    auto names = csrNameSet(info);
    EXPECT_EQ(names, (std::vector<std::string>{"a.example.com", "b.example.com"}));
}

TEST(CsrTest, ExtractNames_NoCn) {
    auto key = generateEcKey();
    auto csr = createCsr(key.get(), "", {"only.example.com"});
    CsrInfo info = extractCsrNames(csr.get());
    EXPECT_TRUE(info.commonName.empty());
    EXPECT_EQ(csrNameSet(info), (std::vector<std::string>{"only.example.com"}));
}

TEST(CsrTest, SameNameSet_CaseInsensitiveAndOrderFree) {
    EXPECT_TRUE(sameNameSet({"A.example.com", "b.example.com"}, {"b.example.com", "a.EXAMPLE.com"}));
    EXPECT_FALSE(sameNameSet({"a.example.com"}, {"a.example.com", "b.example.com"}));
    EXPECT_FALSE(sameNameSet({"a.example.com"}, {"c.example.com"}));
}

// ============================================================================
// Key strength
// ============================================================================

TEST(KeyStrengthTest, AcceptedKeys) {
    auto rsa = generateRsaKey(2048);
    auto p256 = generateEcKey(NID_X9_62_prime256v1);
    auto p384 = generateEcKey(NID_secp384r1);
    auto ed = generateEd25519Key();

    EXPECT_TRUE(checkPublicKeyStrength(rsa.get()).acceptable);
    EXPECT_TRUE(checkPublicKeyStrength(p256.get()).acceptable);
    EXPECT_TRUE(checkPublicKeyStrength(p384.get()).acceptable);
    auto edResult = checkPublicKeyStrength(ed.get());
    EXPECT_TRUE(edResult.acceptable);
    EXPECT_EQ(edResult.keyType, "Ed25519");
}

TEST(KeyStrengthTest, WeakRsaRejected) {
    auto rsa = generateRsaKey(1024);
    auto result = checkPublicKeyStrength(rsa.get());
    EXPECT_FALSE(result.acceptable);
    EXPECT_EQ(result.keyType, "RSA");
    EXPECT_EQ(result.bits, 1024);
    EXPECT_FALSE(result.message.empty());
}

TEST(KeyStrengthTest, UnsupportedCurveRejected) {
    auto k = generateEcKey(NID_secp256k1);
    EXPECT_FALSE(checkPublicKeyStrength(k.get()).acceptable);
}

TEST(KeyStrengthTest, NullKey) {
    EXPECT_FALSE(checkPublicKeyStrength(nullptr).acceptable);
}

// ============================================================================
// Certificate signing
// ============================================================================

class CertOpsTest : public ::testing::Test {
protected:
    UniqueKey caKey_;
    UniqueCert ca_;

    void SetUp() override {
        caKey_ = generateEcKey();
        ca_ = createRootCa(caKey_.get(), "ACME Test Root");
    }
};

TEST_F(CertOpsTest, Serial_PositiveAndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string s = generateSerialHex();
        EXPECT_LE(s.size(), 32u);
        EXPECT_NE(s, "0");
        EXPECT_TRUE(seen.insert(s).second);
    }
}

TEST_F(CertOpsTest, Leaf_CarriesRequestedFields) {
    auto subject = generateRsaKey(2048);
    LeafCertificateRequest req;
    req.subjectKey = subject.get();
    req.commonName = "www.example.com";
    req.dnsNames = {"www.example.com", "example.com"};
    req.serialHex = generateSerialHex();
    req.notBefore = time(nullptr) - 60;
    req.notAfter = req.notBefore + 90 * 86400L;
    req.ocspResponderUrl = "http://acme.test/ocsp";

    auto cert = signLeafCertificate(req, ca_.get(), caKey_.get());
    ASSERT_NE(cert, nullptr);

    EXPECT_EQ(serialHex(cert.get()), req.serialHex);
    EXPECT_EQ(certificateNotAfter(cert.get()), req.notAfter);
    EXPECT_TRUE(samePublicKey(cert.get(), subject.get()));
    EXPECT_EQ(X509_verify(cert.get(), caKey_.get()), 1);
    EXPECT_EQ(X509_check_host(cert.get(), "example.com", 0, 0, nullptr), 1);
    EXPECT_EQ(X509_check_host(cert.get(), "other.com", 0, 0, nullptr), 0);

    // Not a CA, server+client auth
    EXPECT_EQ(X509_check_ca(cert.get()), 0);
    EXPECT_NE(X509_get_extended_key_usage(cert.get()) & XKU_SSL_SERVER, 0u);
    EXPECT_NE(X509_get_extended_key_usage(cert.get()) & XKU_SSL_CLIENT, 0u);
}

TEST_F(CertOpsTest, Leaf_NoNamesFails) {
    auto subject = generateEcKey();
    LeafCertificateRequest req;
    req.subjectKey = subject.get();
    req.serialHex = generateSerialHex();
    req.notBefore = time(nullptr);
    req.notAfter = req.notBefore + 3600;
    EXPECT_EQ(signLeafCertificate(req, ca_.get(), caKey_.get()), nullptr);
}

TEST_F(CertOpsTest, Leaf_SignedByEd25519Ca) {
    auto edKey = generateEd25519Key();
    auto edCa = createRootCa(edKey.get(), "Ed25519 Root", 3650, nullptr);
    auto subject = generateEcKey();

    LeafCertificateRequest req;
    req.subjectKey = subject.get();
    req.commonName = "ed.example.com";
    req.dnsNames = {"ed.example.com"};
    req.serialHex = generateSerialHex();
    req.notBefore = time(nullptr);
    req.notAfter = req.notBefore + 3600;

    auto cert = signLeafCertificate(req, edCa.get(), edKey.get());
    ASSERT_NE(cert, nullptr);
    EXPECT_EQ(X509_verify(cert.get(), edKey.get()), 1);
}

TEST_F(CertOpsTest, OcspResponder_HasSigningEku) {
    auto key = generateEcP256Key();
    ASSERT_NE(key, nullptr);
    std::time_t now = time(nullptr);
    auto cert = signOcspResponderCertificate(key.get(), generateSerialHex(), now, now + 3 * 86400L,
                                             ca_.get(), caKey_.get());
    ASSERT_NE(cert, nullptr);
    EXPECT_NE(X509_get_extended_key_usage(cert.get()) & XKU_OCSP_SIGN, 0u);
    EXPECT_GE(X509_get_ext_by_NID(cert.get(), NID_id_pkix_OCSP_noCheck, -1), 0);
}

// ============================================================================
// Encodings and time
// ============================================================================

TEST_F(CertOpsTest, Pem_BundleKeepsOrder) {
    auto otherKey = generateEcKey();
    auto other = createRootCa(otherKey.get(), "Second Root");
    std::string bundle = certificateToPem(ca_.get()) + certificateToPem(other.get());

    auto certs = certificatesFromPemBundle(bundle);
    ASSERT_EQ(certs.size(), 2u);
    EXPECT_EQ(certificateFingerprint(certs[0].get()), certificateFingerprint(ca_.get()));
    EXPECT_EQ(certificateFingerprint(certs[1].get()), certificateFingerprint(other.get()));
    EXPECT_EQ(certificateFingerprint(ca_.get()).size(), 64u);
}

TEST_F(CertOpsTest, Der_AndKeyPem) {
    auto der = certificateToDer(ca_.get());
    auto back = certificateFromDer(der);
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(X509_cmp(back.get(), ca_.get()), 0);

    auto key = privateKeyFromPem(privateKeyToPem(caKey_.get()));
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(EVP_PKEY_eq(key.get(), caKey_.get()), 1);

    EXPECT_EQ(certificateFromPem("garbage"), nullptr);
}

TEST(Rfc3339Test, FormatAndParse) {
    EXPECT_EQ(formatRfc3339(0), "1970-01-01T00:00:00Z");
    std::time_t t = 0;
    ASSERT_TRUE(parseRfc3339("2026-10-19T12:00:00Z", t));
    EXPECT_EQ(formatRfc3339(t), "2026-10-19T12:00:00Z");
}

TEST(Rfc3339Test, ParseFractionAndOffset) {
    std::time_t a = 0;
    std::time_t b = 0;
    ASSERT_TRUE(parseRfc3339("2026-10-19T12:00:00.123456Z", a));
    ASSERT_TRUE(parseRfc3339("2026-10-19T14:00:00+02:00", b));
    EXPECT_EQ(a, b);
}

TEST(Rfc3339Test, ParseRejectsGarbage) {
    std::time_t t = 0;
    EXPECT_FALSE(parseRfc3339("yesterday", t));
    EXPECT_FALSE(parseRfc3339("", t));
}
