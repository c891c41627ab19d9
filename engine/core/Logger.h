// Console logger with a level filter and a swappable sink.
#pragma once

#include <functional>
#include <string_view>

namespace Neon {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static void log(LogLevel level, std::string_view message);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    // Replaces console output (e.g. to feed a UI log widget or silence tests).
    static void setSink(Sink sink);
    static void resetSink();
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Neon
