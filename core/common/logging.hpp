#pragma once

#include <functional>
#include <string>

namespace trustnet {

enum class LogLevel {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
};

const char* logLevelName(LogLevel level);

/// Receives every line at or above the current level.
using LogSink = std::function<void(LogLevel, const std::string&)>;

/// Minimum level that reaches the sink. Defaults to Info.
void setLogLevel(LogLevel level);
LogLevel logLevel();

/// Replace the output sink. Passing an empty function restores the
/// default console sink (stdout for Debug/Info, stderr for Warn/Error).
void setLogSink(LogSink sink);

void logDebug(const std::string& msg);
void logInfo(const std::string& msg);
void logWarn(const std::string& msg);
void logError(const std::string& msg);

} // namespace trustnet
