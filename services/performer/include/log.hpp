#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

// Line-oriented log output:
//   [performer] INFO Task validation passed taskId=task-1 payloadSize=9
// debug/info go to stdout, warn/error to stderr.

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

using LogField = std::pair<const char*, std::string>;

void set_log_level(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* to_string(LogLevel level);

void log_line(LogLevel level, const char* component, const std::string& message,
              std::initializer_list<LogField> fields = {});

inline void log_debug(const char* component, const std::string& message, std::initializer_list<LogField> fields = {}) {
    log_line(LogLevel::Debug, component, message, fields);
}
inline void log_info(const char* component, const std::string& message, std::initializer_list<LogField> fields = {}) {
    log_line(LogLevel::Info, component, message, fields);
}
inline void log_warn(const char* component, const std::string& message, std::initializer_list<LogField> fields = {}) {
    log_line(LogLevel::Warn, component, message, fields);
}
inline void log_error(const char* component, const std::string& message, std::initializer_list<LogField> fields = {}) {
    log_line(LogLevel::Error, component, message, fields);
}
