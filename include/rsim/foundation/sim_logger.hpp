#pragma once

/// @file sim_logger.hpp
/// @brief SimLogger wrapping the kcenon common logger registry for
/// category-filtered simulator logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rsim/foundation/sim_result.hpp"
#include "rsim/foundation/types.hpp"

namespace rsim::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Startup, shutdown, CLI
    Config      = 1, ///< Configuration loading and validation
    Rating      = 2, ///< Rating updates
    Matchmaking = 3, ///< Opponent selection
    Simulation  = 4  ///< Round loop
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 5;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Rating", "Matchmaking", "Simulation"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a lower-case level name ("trace" ... "off").
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = PlayerId(42);
///   ctx.extra["delta"] = "16.0";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Rating,
///                         "Rating updated", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<std::string> runId;
    std::unordered_map<std::string, std::string> extra;
};

/// Simulator logger wrapping kcenon's logging system.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control. Uses PIMPL to hide
/// kcenon implementation details from the public API.
///
/// All categories default to Info.
class SimLogger {
public:
    SimLogger();
    ~SimLogger();

    // Non-copyable, movable.
    SimLogger(const SimLogger&) = delete;
    SimLogger& operator=(const SimLogger&) = delete;
    SimLogger(SimLogger&&) noexcept;
    SimLogger& operator=(SimLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum log level for every category.
    void setAllCategoryLevels(LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    SimResult<void> flush();

    /// Get the process-wide SimLogger instance.
    static SimLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rsim::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace — macros are global)
// ---------------------------------------------------------------------------

/// @name RSIM_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// RSIM_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef RSIM_MIN_LOG_LEVEL
    #define RSIM_MIN_LOG_LEVEL 0
#endif

#define RSIM_LOG(level, cat, msg)                                                  \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= RSIM_MIN_LOG_LEVEL &&                       \
            ::rsim::foundation::SimLogger::instance().isEnabled((level), (cat)))   \
        {                                                                          \
            ::rsim::foundation::SimLogger::instance().log((level), (cat), (msg));  \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define RSIM_LOG_TRACE(cat, msg) \
    RSIM_LOG(::rsim::foundation::LogLevel::Trace, (cat), (msg))

#define RSIM_LOG_DEBUG(cat, msg) \
    RSIM_LOG(::rsim::foundation::LogLevel::Debug, (cat), (msg))

#define RSIM_LOG_INFO(cat, msg) \
    RSIM_LOG(::rsim::foundation::LogLevel::Info, (cat), (msg))

#define RSIM_LOG_WARN(cat, msg) \
    RSIM_LOG(::rsim::foundation::LogLevel::Warning, (cat), (msg))

#define RSIM_LOG_ERROR(cat, msg) \
    RSIM_LOG(::rsim::foundation::LogLevel::Error, (cat), (msg))

/// @}
