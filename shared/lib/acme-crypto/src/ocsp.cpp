/**
 * @file ocsp.cpp
 * @brief OCSP response construction
 */

#include <acme/crypto/ocsp.h>
#include <acme/crypto/cert_ops.h>

#include <openssl/bn.h>
#include <openssl/err.h>

namespace acme::crypto {

namespace {

struct OcspRequestDeleter { void operator()(OCSP_REQUEST* p) const { OCSP_REQUEST_free(p); } };
using UniqueOcspRequest = std::unique_ptr<OCSP_REQUEST, OcspRequestDeleter>;

struct BasicRespDeleter { void operator()(OCSP_BASICRESP* p) const { OCSP_BASICRESP_free(p); } };
using UniqueBasicResp = std::unique_ptr<OCSP_BASICRESP, BasicRespDeleter>;

struct CertIdDeleter { void operator()(OCSP_CERTID* p) const { OCSP_CERTID_free(p); } };
using UniqueCertId = std::unique_ptr<OCSP_CERTID, CertIdDeleter>;

struct TimeDeleter { void operator()(ASN1_TIME* p) const { ASN1_TIME_free(p); } };
using UniqueTime = std::unique_ptr<ASN1_TIME, TimeDeleter>;

std::string responseToDer(OCSP_RESPONSE* resp) {
    if (!resp) return "";
    unsigned char* der = nullptr;
    int len = i2d_OCSP_RESPONSE(resp, &der);
    if (len <= 0) return "";
    std::string out(reinterpret_cast<char*>(der), static_cast<size_t>(len));
    OPENSSL_free(der);
    return out;
}

std::string statusOnlyResponse(int status) {
    UniqueOcspResponse resp(OCSP_response_create(status, nullptr));
    return responseToDer(resp.get());
}

std::string integerToHex(const ASN1_INTEGER* value) {
    BIGNUM* bn = ASN1_INTEGER_to_BN(value, nullptr);
    if (!bn) return "";
    char* hex = BN_bn2hex(bn);
    std::string out(hex ? hex : "");
    OPENSSL_free(hex);
    BN_free(bn);
    return out;
}

} // anonymous namespace

std::string buildOcspResponse(
    const std::string& requestDer,
    const OcspSigner& signer,
    const OcspStatusLookup& lookup,
    std::time_t now,
    long validitySeconds)
{
    const auto* p = reinterpret_cast<const unsigned char*>(requestDer.data());
    UniqueOcspRequest req(d2i_OCSP_REQUEST(nullptr, &p, static_cast<long>(requestDer.size())));
    if (!req || OCSP_request_onereq_count(req.get()) <= 0) {
        ERR_clear_error();
        return statusOnlyResponse(OCSP_RESPONSE_STATUS_MALFORMEDREQUEST);
    }

    if (!signer.caCert || !signer.responderCert || !signer.responderKey) {
        return statusOnlyResponse(OCSP_RESPONSE_STATUS_TRYLATER);
    }

    UniqueBasicResp basic(OCSP_BASICRESP_new());
    UniqueTime thisUpdate(ASN1_TIME_set(nullptr, now));
    UniqueTime nextUpdate(ASN1_TIME_set(nullptr, now + validitySeconds));
    if (!basic || !thisUpdate || !nextUpdate) {
        return statusOnlyResponse(OCSP_RESPONSE_STATUS_INTERNALERROR);
    }

    int count = OCSP_request_onereq_count(req.get());
    for (int i = 0; i < count; ++i) {
        OCSP_ONEREQ* one = OCSP_request_onereq_get0(req.get(), i);
        OCSP_CERTID* cid = OCSP_onereq_get0_id(one);

        ASN1_OBJECT* mdOid = nullptr;
        ASN1_INTEGER* serial = nullptr;
        OCSP_id_get0_info(nullptr, &mdOid, nullptr, &serial, cid);

        const EVP_MD* md = mdOid ? EVP_get_digestbyobj(mdOid) : nullptr;
        UniqueCertId caId(md ? OCSP_cert_to_id(md, nullptr, signer.caCert) : nullptr);

        OcspCertStatus status;
        if (caId && OCSP_id_issuer_cmp(caId.get(), cid) == 0 && serial) {
            status = lookup(integerToHex(serial));
        }

        int statusCode = V_OCSP_CERTSTATUS_UNKNOWN;
        int reason = -1;
        UniqueTime revokedAt;
        if (status.status == OcspCertStatus::Status::GOOD) {
            statusCode = V_OCSP_CERTSTATUS_GOOD;
        } else if (status.status == OcspCertStatus::Status::REVOKED) {
            statusCode = V_OCSP_CERTSTATUS_REVOKED;
            reason = status.reason;
            revokedAt.reset(ASN1_TIME_set(nullptr, status.revokedAt));
        }

        if (!OCSP_basic_add1_status(basic.get(), cid, statusCode, reason, revokedAt.get(),
                                    thisUpdate.get(), nextUpdate.get())) {
            ERR_clear_error();
            return statusOnlyResponse(OCSP_RESPONSE_STATUS_INTERNALERROR);
        }
    }

    // 2 means "no nonce in request"
    if (OCSP_copy_nonce(basic.get(), req.get()) <= 0) {
        ERR_clear_error();
        return statusOnlyResponse(OCSP_RESPONSE_STATUS_INTERNALERROR);
    }

    const EVP_MD* md = digestForKey(signer.responderKey);
    if (OCSP_basic_sign(basic.get(), signer.responderCert, signer.responderKey, md, nullptr, 0) != 1) {
        ERR_clear_error();
        return statusOnlyResponse(OCSP_RESPONSE_STATUS_INTERNALERROR);
    }

    UniqueOcspResponse resp(OCSP_response_create(OCSP_RESPONSE_STATUS_SUCCESSFUL, basic.get()));
    return responseToDer(resp.get());
}

} // namespace acme::crypto
