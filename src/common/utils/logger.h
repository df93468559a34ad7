#ifndef AGENTFLOW_COMMON_UTILS_LOGGER_H
#define AGENTFLOW_COMMON_UTILS_LOGGER_H

#include <cstdint>
#include <string>

namespace agentflow {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

// "debug", "info", "warning", "error", "off"; unknown names map to INFO
LogLevel parse_log_level(const std::string& name);

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Writes "[LEVEL] message" to std::cerr when `level` passes the filter
void log_message(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log_message(LogLevel::DEBUG, message); }
inline void log_info(const std::string& message) { log_message(LogLevel::INFO, message); }
inline void log_warning(const std::string& message) { log_message(LogLevel::WARNING, message); }
inline void log_error(const std::string& message) { log_message(LogLevel::ERROR, message); }

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_LOGGER_H
