#pragma once

/// @file sim_logger.hpp
/// @brief SimLogger wrapping kcenon logger interfaces for category-based
///        structured logging.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "lsim/foundation/sim_result.hpp"

namespace lsim::foundation {

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

/// Simulator log categories. Each category has its own minimum level.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Library setup and foundation
    Rating     = 1, ///< Elo initialization and updates
    GoalModel  = 2, ///< Base rate and attack/defense derivation
    Simulation = 3, ///< Per-match goal sampling
    Season     = 4, ///< Fixture loop orchestration
    Config     = 5  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Rating", "GoalModel", "Simulation", "Season", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

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

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.team = "Arsenal";
///   ctx.opponent = "Chelsea";
///   ctx.extra["score"] = "2-1";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Season,
///                         "Fixture resolved", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> team;
    std::optional<std::string> opponent;
    std::optional<uint64_t> fixtureIndex;
    std::optional<std::string> traceId;
    std::map<std::string, std::string> extra;
};

/// Category-filtered logger on top of kcenon's logger registry.
///
/// Uses PIMPL so kcenon headers stay out of the public API.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Rating     | Info          |
/// | GoalModel  | Info          |
/// | Simulation | Debug         |
/// | Season     | Info          |
/// | Config     | Info          |
class SimLogger {
public:
    SimLogger();
    ~SimLogger();

    SimLogger(const SimLogger&) = delete;
    SimLogger& operator=(const SimLogger&) = delete;
    SimLogger(SimLogger&&) noexcept;
    SimLogger& operator=(SimLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default registered logger.
    SimResult<void> flush();

    static SimLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lsim::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// LSIM_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef LSIM_MIN_LOG_LEVEL
    #define LSIM_MIN_LOG_LEVEL 0
#endif

#define LSIM_LOG(level, cat, msg)                                                  \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= LSIM_MIN_LOG_LEVEL &&                       \
            ::lsim::foundation::SimLogger::instance().isEnabled((level), (cat)))   \
        {                                                                          \
            ::lsim::foundation::SimLogger::instance().log((level), (cat), (msg));  \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define LSIM_LOG_DEBUG(cat, msg) \
    LSIM_LOG(::lsim::foundation::LogLevel::Debug, (cat), (msg))

#define LSIM_LOG_INFO(cat, msg) \
    LSIM_LOG(::lsim::foundation::LogLevel::Info, (cat), (msg))

#define LSIM_LOG_WARN(cat, msg) \
    LSIM_LOG(::lsim::foundation::LogLevel::Warning, (cat), (msg))

#define LSIM_LOG_ERROR(cat, msg) \
    LSIM_LOG(::lsim::foundation::LogLevel::Error, (cat), (msg))
