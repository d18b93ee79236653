/**
 * @file cares_txt_resolver.cpp
 * @brief CaresTxtResolver implementation
 */
#include "cares_txt_resolver.h"
#include <ares.h>
#include <arpa/nameser.h>
#include <sys/select.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace infrastructure {
namespace dns {

namespace {

struct TxtQueryState {
    bool done = false;
    int status = ARES_ENODATA;
    std::vector<std::string> records;
};

void txtCallback(void* arg, int status, int /*timeouts*/, unsigned char* abuf, int alen) {
    auto* state = static_cast<TxtQueryState*>(arg);
    state->done = true;
    state->status = status;
    if (status != ARES_SUCCESS) {
        return;
    }

    struct ares_txt_ext* reply = nullptr;
    int rc = ares_parse_txt_reply_ext(abuf, alen, &reply);
    if (rc != ARES_SUCCESS) {
        state->status = rc;
        return;
    }

    // A record split into several character-strings is one logical value
    std::string current;
    for (auto* txt = reply; txt != nullptr; txt = txt->next) {
        if (txt->record_start && txt != reply) {
            state->records.push_back(current);
            current.clear();
        }
        current.append(reinterpret_cast<const char*>(txt->txt), txt->length);
    }
    if (reply) {
        state->records.push_back(current);
    }
    ares_free_data(reply);
}

struct AresChannel {
    AresChannel(int timeoutMs, const std::string& servers) {
        ares_options options;
        std::memset(&options, 0, sizeof(options));
        options.timeout = timeoutMs;
        options.tries = 2;
        int optmask = ARES_OPT_TIMEOUTMS | ARES_OPT_TRIES;

        if (ares_init_options(&channel, &options, optmask) != ARES_SUCCESS) {
            throw std::runtime_error("Failed to initialize c-ares channel");
        }
        if (!servers.empty()) {
            int rc = ares_set_servers_ports_csv(channel, servers.c_str());
            if (rc != ARES_SUCCESS) {
                ares_destroy(channel);
                throw std::runtime_error(std::string("Invalid DNS_SERVERS: ") + ares_strerror(rc));
            }
        }
    }

    ~AresChannel() {
        ares_destroy(channel);
    }

    AresChannel(const AresChannel&) = delete;
    AresChannel& operator=(const AresChannel&) = delete;

    ares_channel channel;
};

} // anonymous namespace

CaresTxtResolver::CaresTxtResolver(std::string servers)
    : servers_(std::move(servers))
{
    static const int libraryInitResult = ares_library_init(ARES_LIB_INIT_ALL);
    if (libraryInitResult != ARES_SUCCESS) {
        throw std::runtime_error("Failed to initialize c-ares");
    }
    spdlog::info("[CaresTxtResolver] Using {}", servers_.empty() ? "system resolver" : servers_);
}

services::DnsTxtResult CaresTxtResolver::resolveTxt(const std::string& name, int timeoutSeconds) {
    services::DnsTxtResult result;

    AresChannel ares(timeoutSeconds * 1000 / 2, servers_);
    TxtQueryState state;
    ares_query(ares.channel, name.c_str(), ns_c_in, ns_t_txt, txtCallback, &state);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);
    bool timedOut = false;
    while (!state.done) {
        fd_set readFds;
        fd_set writeFds;
        FD_ZERO(&readFds);
        FD_ZERO(&writeFds);
        int nfds = ares_fds(ares.channel, &readFds, &writeFds);
        if (nfds == 0) {
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            ares_cancel(ares.channel);
            break;
        }
        timeval maxTv;
        maxTv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        maxTv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);
        timeval tv;
        timeval* tvp = ares_timeout(ares.channel, &maxTv, &tv);

        select(nfds, &readFds, &writeFds, nullptr, tvp);
        ares_process(ares.channel, &readFds, &writeFds);
    }

    if (timedOut || !state.done) {
        result.error = "DNS query timed out";
        return result;
    }

    if (state.status == ARES_SUCCESS) {
        result.resolved = true;
        result.records = std::move(state.records);
    } else if (state.status == ARES_ENODATA || state.status == ARES_ENOTFOUND) {
        // Authoritative "no such record" is an answer, not a transport failure
        result.resolved = true;
    } else {
        result.error = ares_strerror(state.status);
    }

    spdlog::debug("[CaresTxtResolver] {} -> {} records ({})",
        name, result.records.size(), result.resolved ? "resolved" : result.error);
    return result;
}

} // namespace dns
} // namespace infrastructure
