#ifndef GAMBIT_LOG_HPP
#define GAMBIT_LOG_HPP

#include <iostream>
#include <string>

namespace gambit {

enum class LogLevel { ERROR, WARN, INFO, DEBUG };

inline LogLevel& logThreshold() {
    static LogLevel level = LogLevel::WARN;
    return level;
}

inline void setLogLevel(LogLevel level) { logThreshold() = level; }

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logThreshold());
}

inline void logLine(LogLevel level, const std::string& msg) {
    if (!logEnabled(level)) return;
    static const char* const TAGS[] = {"error", "warn", "info", "debug"};
    std::cerr << "[gambit " << TAGS[static_cast<int>(level)] << "] " << msg << std::endl;
}

} // namespace gambit

#endif // GAMBIT_LOG_HPP
