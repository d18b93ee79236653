/**
 * @file file_challenge_publisher.cpp
 * @brief FileChallengePublisher implementation
 */
#include "file_challenge_publisher.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace infrastructure {

namespace {

bool isSafeToken(const std::string& token) {
    if (token.empty()) return false;
    for (char c : token) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

} // anonymous namespace

FileChallengePublisher::FileChallengePublisher(std::string directory)
    : directory_(std::move(directory))
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create challenge directory " + directory_ + ": " + ec.message());
    }
    spdlog::info("[FileChallengePublisher] Publishing http-01 responses to {}", directory_);
}

std::string FileChallengePublisher::pathFor(const std::string& token) const {
    return (fs::path(directory_) / token).string();
}

void FileChallengePublisher::publish(const std::string& token, const std::string& keyAuthorization) {
    if (!isSafeToken(token)) {
        throw std::invalid_argument("FileChallengePublisher: invalid token");
    }

    // Write then rename so the proxy never serves a partial file
    std::string target = pathFor(token);
    std::string temp = target + ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + temp);
        }
        out << keyAuthorization;
    }
    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        throw std::runtime_error("Cannot publish " + target + ": " + ec.message());
    }
    spdlog::debug("[FileChallengePublisher] Published {}", token);
}

void FileChallengePublisher::withdraw(const std::string& token) {
    if (!isSafeToken(token)) {
        return;
    }
    std::error_code ec;
    fs::remove(pathFor(token), ec);
    if (ec) {
        spdlog::warn("[FileChallengePublisher] Cannot remove {}: {}", token, ec.message());
    }
}

} // namespace infrastructure
