// Minimal console logger with a level threshold; safe to share across battle threads.
#pragma once

#include <string_view>

namespace Arena {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    static void log(LogLevel level, std::string_view message);
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();
    static bool enabled(LogLevel level);
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Arena
