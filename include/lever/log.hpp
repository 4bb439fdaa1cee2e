#ifndef LEVER_LOG_HPP
#define LEVER_LOG_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace lever {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, OFF };

// =============================================================================
// Logger - process-wide, level-filtered, thread-safe
// =============================================================================

class Logger {
public:
    // Log to a stream (std::clog by default); the stream must outlive use
    static void initialize(LogLevel min_level, std::ostream* sink = nullptr);

    // Append to a file
    static void initialize_file(const std::string& path, LogLevel min_level);

    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    // "debug", "info", "warning"/"warn", "error", "off"
    static LogLevel parse_level(std::string_view name);
    static const char* level_name(LogLevel level);

    static void log(LogLevel level, std::string_view message);

    template <typename... Args>
    static void debug(fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(LogLevel::DEBUG)) log(LogLevel::DEBUG, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(LogLevel::INFO)) log(LogLevel::INFO, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warning(fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(LogLevel::WARNING)) log(LogLevel::WARNING, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(LogLevel::ERROR)) log(LogLevel::ERROR, fmt::format(format, std::forward<Args>(args)...));
    }
};

} // namespace lever

#endif // LEVER_LOG_HPP
