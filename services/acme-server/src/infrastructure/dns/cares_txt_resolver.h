/**
 * @file cares_txt_resolver.h
 * @brief dns-01 TXT lookups through c-ares
 */
#pragma once

#include <string>
#include "../../services/challenge_probe.h"

namespace infrastructure {
namespace dns {

/**
 * @brief TXT resolver
 *
 * Each lookup runs on its own channel, so the resolver is safe to share
 * between validation workers.
 */
class CaresTxtResolver : public services::IDnsTxtResolver {
public:
    /**
     * @param servers Comma separated name servers ("8.8.8.8,1.1.1.1:53");
     *        /etc/resolv.conf when empty
     * @throws std::runtime_error if c-ares cannot be initialized
     */
    explicit CaresTxtResolver(std::string servers = "");

    services::DnsTxtResult resolveTxt(const std::string& name, int timeoutSeconds) override;

private:
    std::string servers_;
};

} // namespace dns
} // namespace infrastructure
