/**
 * @file drogon_http_fetcher.cpp
 * @brief DrogonHttpFetcher implementation
 */
#include "drogon_http_fetcher.h"
#include <drogon/HttpClient.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <future>
#include <memory>
#include <regex>

namespace infrastructure {
namespace http {

namespace {

// Keys never exceed a few hundred bytes; anything larger is not a key authorization
constexpr size_t kMaxBodyBytes = 64 * 1024;

} // anonymous namespace

services::HttpFetchResult DrogonHttpFetcher::fetch(const std::string& url, int timeoutSeconds) {
    services::HttpFetchResult result;

    std::string origin = extractOrigin(url);
    if (origin.empty()) {
        result.error = "Invalid URL";
        return result;
    }
    spdlog::debug("[DrogonHttpFetcher] GET {}", url);

    auto client = drogon::HttpClient::newHttpClient(origin);
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(extractPath(url));
    req->addHeader("User-Agent", "acme-ca-validator/1.0");
    req->addHeader("Accept", "*/*");

    // The callback may outlive this frame if the wait below times out
    auto promise = std::make_shared<std::promise<services::HttpFetchResult>>();
    auto future = promise->get_future();

    client->sendRequest(req, [promise](drogon::ReqResult reqResult, const drogon::HttpResponsePtr& response) {
        services::HttpFetchResult r;
        if (reqResult == drogon::ReqResult::Ok && response) {
            r.connected = true;
            r.statusCode = static_cast<int>(response->getStatusCode());
            auto body = response->getBody();
            r.body = std::string(body.substr(0, kMaxBodyBytes));
        } else {
            r.error = "Connection failed (drogon result " + std::to_string(static_cast<int>(reqResult)) + ")";
        }
        promise->set_value(std::move(r));
    }, static_cast<double>(timeoutSeconds));

    if (future.wait_for(std::chrono::seconds(timeoutSeconds + 1)) == std::future_status::timeout) {
        spdlog::warn("[DrogonHttpFetcher] {} timed out after {} seconds", url, timeoutSeconds);
        result.error = "Timeout after " + std::to_string(timeoutSeconds) + " seconds";
        return result;
    }

    result = future.get();
    spdlog::debug("[DrogonHttpFetcher] {} -> connected={} status={} ({} bytes)",
        url, result.connected, result.statusCode, result.body.size());
    return result;
}

std::string DrogonHttpFetcher::extractOrigin(const std::string& url) {
    std::regex originRegex(R"(^(https?://[^/:]+(?::\d+)?))");
    std::smatch match;
    if (std::regex_search(url, match, originRegex)) {
        return match.str(1);
    }
    return "";
}

std::string DrogonHttpFetcher::extractPath(const std::string& url) {
    std::regex pathRegex(R"(^https?://[^/]+(/.*)?)");
    std::smatch match;
    if (std::regex_search(url, match, pathRegex)) {
        std::string path = match.str(1);
        return path.empty() ? "/" : path;
    }
    return "/";
}

} // namespace http
} // namespace infrastructure
