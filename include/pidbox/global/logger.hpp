#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide leveled logging for pidbox
 *
 * Every log line goes to stderr so stdout stays reserved for ping results.
 * Format: "<timestamp> [LEVEL] [<thread context>] <message>".
 */

#include <atomic>
#include <cctype>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace pidbox {

enum class LogLevel : uint8_t { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

struct GlobalContext {
    static inline thread_local std::string thread_context{"main"};
    std::mutex stderr_mutex;
    std::atomic<LogLevel> global_log_level{LogLevel::WARN};
    std::atomic<bool> use_color{true};
};

inline GlobalContext& getGlobalContext() {
    static GlobalContext instance;
    return instance;
}

inline void set_log_level(LogLevel level) {
    getGlobalContext().global_log_level.store(level);
}

inline LogLevel get_log_level() {
    return getGlobalContext().global_log_level.load();
}

inline void set_thread_context(std::string name) {
    GlobalContext::thread_context = std::move(name);
}

/**
 * @brief Parse "trace", "debug", "info", "warn"/"warning" or "error"
 */
inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

inline std::string GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename T>
concept Streamable = requires(std::ostream& os, T const& t) {
    { os << t } -> std::convertible_to<std::ostream&>;
};

namespace detail {

template <typename... Args>
    requires(Streamable<Args> && ...)
inline void concat_multi_parameter_inputs(std::ostringstream& stream, const Args&... args) {
    (stream << ... << args);
}

inline const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "[TRACE]";
        case LogLevel::DEBUG: return "[DEBUG]";
        case LogLevel::INFO:  return "[INFO ]";
        case LogLevel::WARN:  return "[WARN ]";
        case LogLevel::ERROR: return "[ERROR]";
    }
    return "[?????]";
}

inline const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[1;34m";
        case LogLevel::WARN:  return "\033[1;33m";
        case LogLevel::ERROR: return "\033[1;31m";
        default:              return nullptr;
    }
}

template <typename... Args>
inline void emit(LogLevel level, const Args&... args) {
    if (level < getGlobalContext().global_log_level.load()) {
        return;
    }
    std::ostringstream oss;
    const char* color = getGlobalContext().use_color.load() ? level_color(level) : nullptr;
    if (color) oss << color;
    oss << GetTimestamp() << ' ' << level_tag(level) << " [" << GlobalContext::thread_context
        << "] ";
    concat_multi_parameter_inputs(oss, args...);
    if (color) oss << "\033[0m";
    oss << '\n';

    std::lock_guard<std::mutex> lock(getGlobalContext().stderr_mutex);
    std::cerr << oss.str();
    std::cerr.flush();
}

} // namespace detail

template <typename... Args>
inline void log_trace(const Args&... args) {
    detail::emit(LogLevel::TRACE, args...);
}

template <typename... Args>
inline void log_debug(const Args&... args) {
    detail::emit(LogLevel::DEBUG, args...);
}

template <typename... Args>
inline void log_info(const Args&... args) {
    detail::emit(LogLevel::INFO, args...);
}

template <typename... Args>
inline void log_warn(const Args&... args) {
    detail::emit(LogLevel::WARN, args...);
}

template <typename... Args>
inline void log_error(const Args&... args) {
    detail::emit(LogLevel::ERROR, args...);
}

} // namespace pidbox
