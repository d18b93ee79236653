/**
 * @file drogon_http_fetcher.h
 * @brief http-01 probe transport on Drogon's HttpClient
 */
#pragma once

#include <string>
#include "../../services/challenge_probe.h"

namespace infrastructure {
namespace http {

/**
 * @brief Blocking GET on top of the asynchronous Drogon client
 *
 * Called from validation workers, never from an event loop thread.
 * Redirects are not followed.
 */
class DrogonHttpFetcher : public services::IHttpFetcher {
public:
    DrogonHttpFetcher() = default;
    ~DrogonHttpFetcher() override = default;

    services::HttpFetchResult fetch(const std::string& url, int timeoutSeconds) override;

    /// @brief "http://host[:port]" part of a URL, empty if not http(s)
    static std::string extractOrigin(const std::string& url);

    /// @brief Path and query of a URL, "/" when absent
    static std::string extractPath(const std::string& url);
};

} // namespace http
} // namespace infrastructure
