#include "../include/log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::mutex g_out_mtx;

void set_log_level(LogLevel level) { g_level.store(level); }

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    if (n == "off" || n == "none") return LogLevel::Off;
    return std::nullopt;
}

void log_line(LogLevel level, const char* component, const std::string& message,
              std::initializer_list<LogField> fields) {
    if (level == LogLevel::Off || level < g_level.load()) return;
    std::ostringstream os;
    os << "[" << component << "] " << to_string(level) << " " << message;
    for (const auto& f : fields) {
        os << " " << f.first << "=" << f.second;
    }
    std::lock_guard<std::mutex> lk(g_out_mtx);
    if (level >= LogLevel::Warn) std::cerr << os.str() << std::endl;
    else std::cout << os.str() << std::endl;
}
