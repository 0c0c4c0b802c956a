#include "Log.h"
#include "ResultCodes.h"

#include <cstdarg>
#include <cstdio>
#include <utility>

namespace scout {

namespace {

LogLevel g_level = LogLevel::Info;
LogSink g_sink;

void writeStderr(LogLevel level, const char* line) {
    std::fprintf(stderr, "[%s] %s\n", toString(level), line);
}

} // namespace

void setLogLevel(LogLevel level) { g_level = level; }
LogLevel logLevel() { return g_level; }

void setLogSink(LogSink sink) { g_sink = std::move(sink); }

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
    }
    return "?";
}

void logf(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::Off || static_cast<int>(level) < static_cast<int>(g_level)) return;

    char line[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    if (g_sink) {
        g_sink(level, line);
    } else {
        writeStderr(level, line);
    }
}

const char* toString(ResultCode code) {
    switch (code) {
    case ResultCode::Ok:                 return "ok";
    case ResultCode::ConfigurationError: return "configuration_error";
    case ResultCode::InsufficientFunds:  return "insufficient_funds";
    case ResultCode::NotFound:           return "not_found";
    case ResultCode::InvalidState:       return "invalid_state";
    case ResultCode::CorruptRecord:      return "corrupt_record";
    case ResultCode::SpawnFailure:       return "spawn_failed";
    case ResultCode::NoOpportunity:      return "no_opportunity";
    case ResultCode::NotAuthoritative:   return "not_authoritative";
    }
    return "unknown";
}

} // namespace scout
