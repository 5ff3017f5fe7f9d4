#pragma once

#include <string>

namespace triplog {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

// Console logging in "[Component] message" form. Debug and info go to
// stdout, warnings and errors to stderr.
class Log {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();
    static bool parseLevel(const std::string& text, LogLevel& out);

    static void debug(const std::string& tag, const std::string& message);
    static void info(const std::string& tag, const std::string& message);
    static void warn(const std::string& tag, const std::string& message);
    static void error(const std::string& tag, const std::string& message);

private:
    static void write(LogLevel level, const std::string& tag, const std::string& message);
};

} // namespace triplog
