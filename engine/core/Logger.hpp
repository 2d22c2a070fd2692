#pragma once

#include <spdlog/spdlog.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Crimson {

/**
 * @brief Named log channels, one spdlog logger each
 *
 * Hot subsystems get their own channel so a single one can be raised to
 * trace without flooding the others.
 */
enum class LogChannel : uint8_t {
    Engine,         // "CRIMSON": config, bootstrap
    Combat,         // "COMBAT": controller, kits, hit resolution
    Projectiles,    // "PROJECTILE": pooled effects
    Status,         // "STATUS": per-target status records
    Economy,        // "ECONOMY": charges, ultimate, buffs
    Count
};

inline constexpr size_t kLogChannelCount = static_cast<size_t>(LogChannel::Count);

[[nodiscard]] const char* LogChannelName(LogChannel channel);

/**
 * @brief Case-insensitive lookup by channel name ("status", "PROJECTILE", ...)
 */
[[nodiscard]] std::optional<LogChannel> LogChannelFromString(std::string_view name);

/**
 * @brief spdlog wrapper owning one logger per LogChannel
 *
 * All channels share the same sinks. Until Initialize() is called Get()
 * returns spdlog's default logger, so the macros are safe from static init
 * and from tests that never set up logging.
 */
class Logger {
public:
    /**
     * @brief Create every channel logger
     * @param logFile Optional path for a rotating log file (5 MB, 3 files)
     * @param consoleOutput Enable colored console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Flush and drop all channel loggers
     */
    static void Shutdown();

    /**
     * @brief Set the minimum level on every channel
     */
    static void SetLevel(spdlog::level::level_enum level);

    static void SetLevel(LogChannel channel, spdlog::level::level_enum level);

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

    [[nodiscard]] static std::shared_ptr<spdlog::logger> Get(LogChannel channel) {
        const auto& logger = s_loggers[static_cast<size_t>(channel)];
        return logger ? logger : spdlog::default_logger();
    }

private:
    static std::array<std::shared_ptr<spdlog::logger>, kLogChannelCount> s_loggers;
    static bool s_initialized;
};

} // namespace Crimson

#define CRIMSON_LOG_CHANNEL(channel, level, ...) \
    ::Crimson::Logger::Get(::Crimson::LogChannel::channel)->level(__VA_ARGS__)

// Engine logging
#define CRIMSON_LOG_INFO(...)     CRIMSON_LOG_CHANNEL(Engine, info, __VA_ARGS__)
#define CRIMSON_LOG_WARN(...)     CRIMSON_LOG_CHANNEL(Engine, warn, __VA_ARGS__)
#define CRIMSON_LOG_ERROR(...)    CRIMSON_LOG_CHANNEL(Engine, error, __VA_ARGS__)

// Combat logging
#define COMBAT_LOG_TRACE(...)     CRIMSON_LOG_CHANNEL(Combat, trace, __VA_ARGS__)
#define COMBAT_LOG_DEBUG(...)     CRIMSON_LOG_CHANNEL(Combat, debug, __VA_ARGS__)
#define COMBAT_LOG_INFO(...)      CRIMSON_LOG_CHANNEL(Combat, info, __VA_ARGS__)
#define COMBAT_LOG_WARN(...)      CRIMSON_LOG_CHANNEL(Combat, warn, __VA_ARGS__)
#define COMBAT_LOG_ERROR(...)     CRIMSON_LOG_CHANNEL(Combat, error, __VA_ARGS__)

#define PROJECTILE_LOG_DEBUG(...) CRIMSON_LOG_CHANNEL(Projectiles, debug, __VA_ARGS__)
#define PROJECTILE_LOG_ERROR(...) CRIMSON_LOG_CHANNEL(Projectiles, error, __VA_ARGS__)

#define STATUS_LOG_TRACE(...)     CRIMSON_LOG_CHANNEL(Status, trace, __VA_ARGS__)
#define STATUS_LOG_ERROR(...)     CRIMSON_LOG_CHANNEL(Status, error, __VA_ARGS__)

#define ECONOMY_LOG_TRACE(...)    CRIMSON_LOG_CHANNEL(Economy, trace, __VA_ARGS__)
#define ECONOMY_LOG_DEBUG(...)    CRIMSON_LOG_CHANNEL(Economy, debug, __VA_ARGS__)
#define ECONOMY_LOG_ERROR(...)    CRIMSON_LOG_CHANNEL(Economy, error, __VA_ARGS__)
