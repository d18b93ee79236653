/**
 * @file logger.h
 * @brief Process-wide spdlog setup for the ACME services
 *
 * One colored console sink and one size-rotated file sink behind the
 * default logger, so plain spdlog::info(...) calls reach both.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace common {

class Logger {
public:
    static constexpr size_t kMaxFileSize = 10 * 1024 * 1024;
    static constexpr size_t kMaxFiles = 5;

    /**
     * @brief Map LOG_LEVEL text to a level; unknown text means info
     *
     * Accepts spdlog names ("trace", "debug", "info", "warn", "err",
     * "critical", "off") plus "warning" and "error".
     */
    static spdlog::level::level_enum parseLevel(const std::string& text) {
        if (text == "warning") return spdlog::level::warn;
        if (text == "error") return spdlog::level::err;
        auto level = spdlog::level::from_str(text);
        if (level == spdlog::level::off && text != "off") {
            return spdlog::level::info;
        }
        return level;
    }

    /**
     * @brief Install the default logger
     * @param serviceName Logger name shown in every line
     * @param level LOG_LEVEL value
     * @param logFile Rotating log file; console only when empty
     */
    static void initialize(
        const std::string& serviceName,
        const std::string& level,
        const std::string& logFile)
    {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (!logFile.empty()) {
                auto parent = std::filesystem::path(logFile).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, kMaxFileSize, kMaxFiles);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(level));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);
            spdlog::flush_every(std::chrono::seconds(3));

            spdlog::info("Logging initialized (service={}, level={}, file={})",
                serviceName, spdlog::level::to_string_view(logger->level()),
                logFile.empty() ? "none" : logFile);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log init failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Log directory unavailable: " << ex.what() << std::endl;
        }
    }
};

} // namespace common
