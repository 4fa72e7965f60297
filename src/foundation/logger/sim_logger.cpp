/// @file sim_logger.cpp
/// @brief SimLogger implementation on top of kcenon's logger registry.

#include "lsim/foundation/sim_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace lsim::foundation {

namespace {

namespace kci = kcenon::common::interfaces;

kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Rating
    LogLevel::Info,   // GoalModel
    LogLevel::Debug,  // Simulation
    LogLevel::Info,   // Season
    LogLevel::Info    // Config
};

std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.team && !ctx.team->empty()) {
        append("team", *ctx.team);
    }
    if (ctx.opponent && !ctx.opponent->empty()) {
        append("opponent", *ctx.opponent);
    }
    if (ctx.fixtureIndex) {
        append("fixture", std::to_string(*ctx.fixtureIndex));
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

std::string formatLine(LogCategory cat, std::string_view msg, std::string_view ctxStr) {
    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }
    return formatted;
}

} // namespace

struct SimLogger::Impl {
    // Atomic for lock-free reads on the hot path.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("lsim.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // Named category logger first, default logger otherwise.
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }
};

SimLogger::SimLogger() : impl_(std::make_unique<Impl>()) {}

SimLogger::~SimLogger() = default;

SimLogger::SimLogger(SimLogger&&) noexcept = default;
SimLogger& SimLogger::operator=(SimLogger&&) noexcept = default;

void SimLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    auto result = logger->log(mapLevel(level), formatLine(cat, msg, {}));
    (void)result;  // sink errors are not propagated
}

void SimLogger::logWithContext(LogLevel level, LogCategory cat,
                               std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    auto result = logger->log(mapLevel(level), formatLine(cat, msg, formatContext(ctx)));
    (void)result;
}

void SimLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel SimLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool SimLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

SimResult<void> SimLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return SimResult<void>::err(
            SimError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return SimResult<void>::ok();
}

SimLogger& SimLogger::instance() {
    static SimLogger inst;
    return inst;
}

} // namespace lsim::foundation
