#include "logger.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
    std::atomic<int> currentLevel{static_cast<int>(LogLevel::Info)};
    std::mutex outputMutex;
    bool progressPending = false;   // a "\r" line is on screen and needs a newline first

    const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warn: return "WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "?";
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = static_cast<int>(level);
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(currentLevel.load());
}

void Logger::debug(const std::string& tag, const std::string& msg) { write(LogLevel::Debug, tag, msg); }
void Logger::info(const std::string& tag, const std::string& msg) { write(LogLevel::Info, tag, msg); }
void Logger::warn(const std::string& tag, const std::string& msg) { write(LogLevel::Warn, tag, msg); }
void Logger::error(const std::string& tag, const std::string& msg) { write(LogLevel::Error, tag, msg); }

void Logger::progress(const std::string& line) {
    if (level() > LogLevel::Info) return;
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << "\r" << line << std::flush;
    progressPending = true;
}

void Logger::write(LogLevel lvl, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(lvl) < currentLevel.load()) return;

    std::lock_guard<std::mutex> lock(outputMutex);
    if (progressPending) {
        std::cout << "\n";
        progressPending = false;
    }
    std::ostream& out = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << levelName(lvl) << "] [" << tag << "] " << msg << "\n";
    out.flush();
}
