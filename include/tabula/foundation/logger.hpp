#pragma once

/// @file logger.hpp
/// @brief Logger wrapping kcenon logger interfaces for category-based structured logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tabula/foundation/tabula_result.hpp"

namespace tabula::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
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
    Core      = 0, ///< Registry construction entry points
    Config    = 1, ///< Configuration and preference loading
    Catalog   = 2, ///< Type catalog and shared modules
    Discovery = 3, ///< Artifact location, enumeration, classification
    Registry  = 4  ///< Registry population
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Catalog", "Discovery", "Registry"
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.location = "/srv/shop/shop.pkg";
///   ctx.candidate = "shop::model::Order";
///   logger.logWithContext(LogLevel::Error, LogCategory::Discovery,
///                         "Couldn't load type", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> location;
    std::optional<std::string> candidate;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging interfaces.
///
/// Every category starts at Info. Uses PIMPL to hide kcenon
/// implementation details from the public API.
class Logger {
public:
    Logger();
    ~Logger();

    // Non-copyable, movable.
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    TabulaResult<void> flush();

    /// Process-wide logger used by the TABULA_LOG macros.
    static Logger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tabula::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// TABULA_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef TABULA_MIN_LOG_LEVEL
    #define TABULA_MIN_LOG_LEVEL 0
#endif

#define TABULA_LOG(level, cat, msg)                                                   \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= TABULA_MIN_LOG_LEVEL &&                        \
            ::tabula::foundation::Logger::instance().isEnabled((level), (cat)))       \
        {                                                                             \
            ::tabula::foundation::Logger::instance().log((level), (cat), (msg));      \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define TABULA_LOG_DEBUG(cat, msg) \
    TABULA_LOG(::tabula::foundation::LogLevel::Debug, (cat), (msg))

#define TABULA_LOG_INFO(cat, msg) \
    TABULA_LOG(::tabula::foundation::LogLevel::Info, (cat), (msg))

#define TABULA_LOG_WARN(cat, msg) \
    TABULA_LOG(::tabula::foundation::LogLevel::Warning, (cat), (msg))

#define TABULA_LOG_ERROR(cat, msg) \
    TABULA_LOG(::tabula::foundation::LogLevel::Error, (cat), (msg))
