/**
 * @file Logger.cpp
 * @brief Logger output and level parsing
 */

#include "patchmaker/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace patchmaker {

namespace {

    constexpr const char* level_prefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "[Debug] ";
            case LogLevel::Info:    return "[Info] ";
            case LogLevel::Warning: return "[Warning] ";
            case LogLevel::Error:   return "[Error] ";
            case LogLevel::Off:     return "";
        }
        return "";
    }

    std::string format_timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto time = system_clock::to_time_t(now);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &time);
#else
        localtime_r(&time, &tm);
#endif
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
        return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                           tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                           tm.tm_hour, tm.tm_min, tm.tm_sec,
                           static_cast<int>(ms.count()));
    }

} // anonymous namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return std::nullopt;
}

void Logger::ConfigureFromEnvironment() {
    const char* env = std::getenv("PATCHMAKER_LOG_LEVEL");
    if (env == nullptr) {
        return;
    }
    if (auto level = parse_log_level(env)) {
        SetLevel(*level);
    }
}

void Logger::SetSink(Sink sink) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

void Logger::Write(LogLevel level, const std::string& message) {
    const std::string line = fmt::format("[{}] {}{}", format_timestamp(), level_prefix(level), message);

    Sink sink;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        sink = s_sink;
    }

    // Called unlocked so a sink may log or replace itself
    if (sink) {
        sink(level, line);
        return;
    }
    fmt::print(stderr, "{}\n", line);
}

} // namespace patchmaker
