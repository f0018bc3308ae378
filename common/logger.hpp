#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// process wide logger, lines look like "[INFO] [Session 0] Connected to ..."
// Warn and Error go to stderr, the rest to stdout.
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    static void debug(const std::string& tag, const std::string& msg);
    static void info(const std::string& tag, const std::string& msg);
    static void warn(const std::string& tag, const std::string& msg);
    static void error(const std::string& tag, const std::string& msg);

    // raw progress output, no level prefix and no newline
    static void progress(const std::string& line);

private:
    static void write(LogLevel level, const std::string& tag, const std::string& msg);
};
