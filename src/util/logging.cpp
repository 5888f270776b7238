// src/util/logging.cpp
#include "chesscore/util/logging.h"
#include "chesscore/core/exceptions.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chesscore {
namespace util {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "off") return spdlog::level::off;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "error") return spdlog::level::err;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "info") return spdlog::level::info;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "trace") return spdlog::level::trace;
    return std::nullopt;
}

std::string setupLogging(const std::string& level, const std::string& logDirectory) {
    auto parsed = parseLogLevel(level);
    if (!parsed) {
        throw core::ConfigException("Unknown log level: " + level);
    }

    if (*parsed == spdlog::level::off) {
        spdlog::set_level(spdlog::level::off);
        return "";
    }

    std::string logFile;
    try {
        spdlog::sink_ptr sink;
        if (logDirectory.empty()) {
            sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        } else {
            std::filesystem::create_directories(logDirectory);

            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::stringstream name;
            name << "chesscore_" << std::put_time(std::localtime(&now), "%Y-%m-%d_%H-%M-%S") << ".log";
            logFile = (std::filesystem::path(logDirectory) / name.str()).string();

            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile);
        }

        // Replaces the default logger, including one from an earlier call
        auto logger = std::make_shared<spdlog::logger>("chesscore", sink);
        logger->set_level(*parsed);
        spdlog::set_default_logger(logger);
        spdlog::set_level(*parsed);
    } catch (const spdlog::spdlog_ex& e) {
        throw core::ConfigException("Failed to set up logging: " + std::string(e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        throw core::ConfigException("Failed to create log directory: " + std::string(e.what()));
    }

    spdlog::info("Logging initialized at {} level", spdlog::level::to_string_view(*parsed));
    return logFile;
}

} // namespace util
} // namespace chesscore
