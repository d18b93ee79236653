/**
 * @file file_challenge_publisher.h
 * @brief http-01 responses written to a directory served under /.well-known/acme-challenge/
 */
#pragma once

#include <string>
#include "../services/challenge_probe.h"

namespace infrastructure {

/**
 * @brief Directory-backed challenge-response publisher
 *
 * One file per token, named after the token, containing the key
 * authorization. Tokens are base64url, so they are safe file names.
 */
class FileChallengePublisher : public services::IChallengeResponsePublisher {
public:
    /**
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit FileChallengePublisher(std::string directory);

    void publish(const std::string& token, const std::string& keyAuthorization) override;
    void withdraw(const std::string& token) override;

    /// @brief Path of the response file for a token
    std::string pathFor(const std::string& token) const;

private:
    std::string directory_;
};

} // namespace infrastructure
