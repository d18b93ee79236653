/**
 * @file acme_urls.h
 * @brief Absolute resource URLs under ACME_BASE_URL
 */

#pragma once

#include <string>

namespace common {

/**
 * @brief Builds every URL the server hands out
 *
 * The JWS "url" header is compared against these, so the server never
 * trusts the Host header of the proxied request.
 */
class AcmeUrls {
public:
    /// @param baseUrl e.g. "https://acme.example.com/acme" (trailing '/' ignored)
    explicit AcmeUrls(std::string baseUrl) : base_(std::move(baseUrl)) {
        while (!base_.empty() && base_.back() == '/') base_.pop_back();
    }

    const std::string& base() const { return base_; }

    std::string directory() const { return base_ + "/directory"; }
    std::string newNonce() const { return base_ + "/new-nonce"; }
    std::string newAccount() const { return base_ + "/new-account"; }
    std::string newOrder() const { return base_ + "/new-order"; }
    std::string revokeCert() const { return base_ + "/revoke-cert"; }
    std::string keyChange() const { return base_ + "/key-change"; }
    std::string crl() const { return base_ + "/crl"; }
    std::string ocsp() const { return base_ + "/ocsp"; }

    std::string accountPrefix() const { return base_ + "/acct/"; }
    std::string account(const std::string& id) const { return accountPrefix() + id; }
    std::string accountOrders(const std::string& id) const { return account(id) + "/orders"; }
    std::string order(const std::string& id) const { return base_ + "/order/" + id; }
    std::string finalize(const std::string& id) const { return order(id) + "/finalize"; }
    std::string authorization(const std::string& id) const { return base_ + "/authz/" + id; }
    std::string challenge(const std::string& id) const { return base_ + "/challenge/" + id; }
    std::string certificate(const std::string& serial) const { return base_ + "/cert/" + serial; }

    /**
     * @brief Path component of the base URL ("/acme"), used to mount routes
     */
    std::string pathPrefix() const {
        auto scheme = base_.find("://");
        if (scheme == std::string::npos) return "";
        auto slash = base_.find('/', scheme + 3);
        return slash == std::string::npos ? "" : base_.substr(slash);
    }

private:
    std::string base_;
};

} // namespace common
