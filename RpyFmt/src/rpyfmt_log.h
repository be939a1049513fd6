//
// rpyfmt_log.h
// rpyfmt - Console Logging
//
// Everything goes to stderr so that --stdout output stays clean. The core
// library never logs; only the command-line tool does.
//

#ifndef RPYFMT_LOG_H
#define RPYFMT_LOG_H

#include <atomic>
#include <iostream>
#include <string>

namespace RpyFmt {

enum class LogLevel {
    Quiet,      // Errors only
    Normal,     // Diagnostics, changed files and the summary
    Verbose     // Per-file progress and timing
};

class Log {
public:
    static void setLevel(LogLevel level) { levelRef().store(level); }
    static LogLevel getLevel() { return levelRef().load(); }

    static bool isVerbose() { return getLevel() == LogLevel::Verbose; }
    static bool isQuiet() { return getLevel() == LogLevel::Quiet; }

    static void verbose(const std::string& message) {
        if (isVerbose()) {
            std::cerr << message << "\n";
        }
    }

    static void info(const std::string& message) {
        if (!isQuiet()) {
            std::cerr << message << "\n";
        }
    }

    static void warning(const std::string& message) {
        if (!isQuiet()) {
            std::cerr << "Warning: " << message << "\n";
        }
    }

    static void error(const std::string& message) {
        std::cerr << "Error: " << message << "\n";
    }

private:
    static std::atomic<LogLevel>& levelRef() {
        static std::atomic<LogLevel> level(LogLevel::Normal);
        return level;
    }
};

} // namespace RpyFmt

#endif // RPYFMT_LOG_H
