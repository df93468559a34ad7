// common/utils/logger.cpp
#include "common/utils/logger.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace agentflow {

namespace {
std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_log_mutex;

const char* tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG] ";
        case LogLevel::INFO: return "[INFO] ";
        case LogLevel::WARNING: return "[WARNING] ";
        case LogLevel::ERROR: return "[ERROR] ";
        default: return "";
    }
}
} // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off" || name == "none") return LogLevel::OFF;
    return LogLevel::INFO;
}

void set_log_level(LogLevel level) { g_level = level; }

LogLevel get_log_level() { return g_level.load(); }

void log_message(LogLevel level, const std::string& message) {
    if (level == LogLevel::OFF || level < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << tag(level) << message << std::endl;
}

} // namespace agentflow
