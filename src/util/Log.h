#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace coedit::util {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Lines look like "[I 12:04:05.123] [Session session-01H...] joined".
class Log {
public:
    static void set_level(LogLevel level) noexcept;
    static LogLevel level() noexcept;
    static bool enabled(LogLevel level) noexcept;

    // Throws std::invalid_argument for unknown names.
    static LogLevel parse_level(std::string_view name);

    static void write(LogLevel level, std::string_view tag, std::string_view text);

    template <typename... Args>
    static void error(std::string_view tag, const Args&... args) { emit(LogLevel::Error, tag, args...); }

    template <typename... Args>
    static void warn(std::string_view tag, const Args&... args) { emit(LogLevel::Warn, tag, args...); }

    template <typename... Args>
    static void info(std::string_view tag, const Args&... args) { emit(LogLevel::Info, tag, args...); }

    template <typename... Args>
    static void debug(std::string_view tag, const Args&... args) { emit(LogLevel::Debug, tag, args...); }

private:
    template <typename... Args>
    static void emit(LogLevel level, std::string_view tag, const Args&... args) {
        if (!enabled(level)) return;
        std::ostringstream os;
        (os << ... << args);
        write(level, tag, os.str());
    }
};

} // namespace coedit::util
