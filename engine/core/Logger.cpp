#include "core/Logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace Crimson {

namespace {

constexpr std::array<const char*, kLogChannelCount> kChannelNames = {
    "CRIMSON", "COMBAT", "PROJECTILE", "STATUS", "ECONOMY"
};

constexpr size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

} // namespace

std::array<std::shared_ptr<spdlog::logger>, kLogChannelCount> Logger::s_loggers;
bool Logger::s_initialized = false;

const char* LogChannelName(LogChannel channel) {
    const auto index = static_cast<size_t>(channel);
    return index < kLogChannelCount ? kChannelNames[index] : "UNKNOWN";
}

std::optional<LogChannel> LogChannelFromString(std::string_view name) {
    for (size_t i = 0; i < kLogChannelCount; ++i) {
        const std::string_view candidate = kChannelNames[i];
        const bool same = candidate.size() == name.size() &&
            std::equal(candidate.begin(), candidate.end(), name.begin(), [](char a, char b) {
                return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
            });
        if (same) {
            return static_cast<LogChannel>(i);
        }
    }
    return std::nullopt;
}

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, kMaxLogFileSize, kMaxLogFiles);
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    for (size_t i = 0; i < kLogChannelCount; ++i) {
        auto logger = std::make_shared<spdlog::logger>(kChannelNames[i], sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        s_loggers[i] = std::move(logger);
    }

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    // Dropping by name leaves spdlog's default logger in place for the fallback
    for (auto& logger : s_loggers) {
        logger->flush();
        spdlog::drop(logger->name());
        logger.reset();
    }

    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (!s_initialized) {
        spdlog::set_level(level);
        return;
    }
    for (auto& logger : s_loggers) {
        logger->set_level(level);
    }
}

void Logger::SetLevel(LogChannel channel, spdlog::level::level_enum level) {
    const auto index = static_cast<size_t>(channel);
    if (index >= kLogChannelCount) {
        return;
    }
    if (s_loggers[index]) {
        s_loggers[index]->set_level(level);
    }
}

} // namespace Crimson
