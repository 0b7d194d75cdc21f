#pragma once

#include <mutex>
#include <string>

namespace idemzip {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Level defaults to IDEMZIP_LOG (error|warn|info|debug or 0..3).
 * Errors and warnings go to stderr, the rest to stdout. Each line is
 * written under a lock so worker threads never interleave output.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse a level name ("warn", "2", ...); returns false if unknown
    static bool parseLevel(const std::string& text, LogLevel& out);

private:
    Logger();
    void write(LogLevel at, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    mutable std::mutex mtx;
};

}
