#include "common/logging.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace trustnet {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sink_mutex;
LogSink g_sink;

std::string timestampNow() {
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
    localtime_r(&t, &tmv);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

void logCommon(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, msg);
        return;
    }
    std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    os << "[" << timestampNow() << "][" << logLevelName(level) << "] " << msg << std::endl;
}

} // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void logDebug(const std::string& msg) { logCommon(LogLevel::Debug, msg); }
void logInfo(const std::string& msg)  { logCommon(LogLevel::Info, msg); }
void logWarn(const std::string& msg)  { logCommon(LogLevel::Warn, msg); }
void logError(const std::string& msg) { logCommon(LogLevel::Error, msg); }

} // namespace trustnet
