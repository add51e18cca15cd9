/**
 * @file Logger.hpp
 * @brief Minimal leveled logger on top of fmt
 *
 * Lines go to stderr as "[timestamp] [Level] message". The threshold
 * defaults to Warning and can be set programmatically, by name (for the
 * "log.level" setting) or from PATCHMAKER_LOG_LEVEL.
 */

#ifndef PATCHMAKER_LOGGER_HPP
#define PATCHMAKER_LOGGER_HPP

#include <fmt/format.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace patchmaker {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error", "off")
 * @return The level, or std::nullopt for unknown names (case-insensitive)
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    template <typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
        Log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Log(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    static void SetLevel(LogLevel level) {
        s_level.store(level, std::memory_order_release);
    }

    static LogLevel GetLevel() {
        return s_level.load(std::memory_order_acquire);
    }

    static bool IsEnabled(LogLevel level) {
        return level != LogLevel::Off && level >= GetLevel();
    }

    /**
     * @brief Apply PATCHMAKER_LOG_LEVEL if it names a valid level
     */
    static void ConfigureFromEnvironment();

    /**
     * @brief Replace the stderr sink (tests capture output this way)
     *
     * Passing an empty function restores stderr.
     */
    static void SetSink(Sink sink);

private:
    template <typename... Args>
    static void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (!IsEnabled(level)) {
            return;
        }
        Write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    static void Write(LogLevel level, const std::string& message);

    static inline std::atomic<LogLevel> s_level{LogLevel::Warning};
    static inline std::mutex s_mutex{};
    static inline Sink s_sink{};
};

} // namespace patchmaker

#endif // PATCHMAKER_LOGGER_HPP
