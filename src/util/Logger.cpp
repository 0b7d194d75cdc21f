#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace idemzip {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("IDEMZIP_LOG");
    LogLevel level = LogLevel::Info;
    if (env) Logger::parseLevel(env, level);
    return level;
}

bool Logger::parseLevel(const std::string& v, LogLevel& out) {
    if (v == "debug" || v == "3") { out = LogLevel::Debug; return true; }
    if (v == "info" || v == "2") { out = LogLevel::Info; return true; }
    if (v == "warn" || v == "1") { out = LogLevel::Warn; return true; }
    if (v == "error" || v == "0") { out = LogLevel::Error; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) {
    std::scoped_lock lock(mtx);
    currentLevel = level;
}

LogLevel Logger::level() const {
    std::scoped_lock lock(mtx);
    return currentLevel;
}

void Logger::write(LogLevel at, const char* tag, const std::string& msg) const {
    std::scoped_lock lock(mtx);
    if (currentLevel < at) return;
    std::ostream& os = (at <= LogLevel::Warn) ? std::cerr : std::cout;
    os << tag << ' ' << msg << "\n";
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "[error]", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "[warn ]", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "[info ]", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "[debug]", msg); }

}
