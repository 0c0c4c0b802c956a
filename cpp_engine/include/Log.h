#pragma once

#include <functional>

namespace scout {

enum class LogLevel : int {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

// Receives one fully formatted line (no trailing newline).
using LogSink = std::function<void(LogLevel, const char*)>;

void setLogLevel(LogLevel level);
LogLevel logLevel();

// An empty sink restores the default stderr writer.
void setLogSink(LogSink sink);

const char* toString(LogLevel level);

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
void logf(LogLevel level, const char* fmt, ...);

} // namespace scout

#define SCOUT_LOG_DEBUG(...) ::scout::logf(::scout::LogLevel::Debug, __VA_ARGS__)
#define SCOUT_LOG_INFO(...)  ::scout::logf(::scout::LogLevel::Info, __VA_ARGS__)
#define SCOUT_LOG_WARN(...)  ::scout::logf(::scout::LogLevel::Warn, __VA_ARGS__)
#define SCOUT_LOG_ERROR(...) ::scout::logf(::scout::LogLevel::Error, __VA_ARGS__)
