/**
 * @file challenge_probe.h
 * @brief Network probes used by challenge validation
 *
 * Implementations live in infrastructure/ (Drogon HttpClient, c-ares).
 * Tests substitute scripted probes.
 */

#pragma once

#include <string>
#include <vector>

namespace services {

/**
 * @brief Result of one http-01 fetch
 */
struct HttpFetchResult {
    bool connected = false;     // false: DNS, connect, TLS or timeout failure
    int statusCode = 0;
    std::string body;
    std::string error;          // Set when !connected
};

class IHttpFetcher {
public:
    virtual ~IHttpFetcher() = default;

    /**
     * @brief GET url with a hard timeout
     * @note Must not throw for network failures; report them in the result
     */
    virtual HttpFetchResult fetch(const std::string& url, int timeoutSeconds) = 0;
};

/**
 * @brief Result of one TXT lookup
 */
struct DnsTxtResult {
    bool resolved = false;      // false: SERVFAIL, timeout, NXDOMAIN...
    std::vector<std::string> records;
    std::string error;
};

class IDnsTxtResolver {
public:
    virtual ~IDnsTxtResolver() = default;

    /**
     * @brief Query TXT records of name with a hard timeout
     * @note Must not throw for resolution failures
     */
    virtual DnsTxtResult resolveTxt(const std::string& name, int timeoutSeconds) = 0;
};

/**
 * @brief Optional hosting of http-01 responses by this server
 */
class IChallengeResponsePublisher {
public:
    virtual ~IChallengeResponsePublisher() = default;

    virtual void publish(const std::string& token, const std::string& keyAuthorization) = 0;
    virtual void withdraw(const std::string& token) = 0;
};

} // namespace services
