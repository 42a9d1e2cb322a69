#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_out_mtx;

void write(LogLevel level, const char* tag, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_out_mtx);
    std::ostream& os = level >= LogLevel::Warn ? std::cerr : std::cout;
    os << "[coordinator] " << tag << msg << std::endl;
}
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::toupper(c); });
    if (n == "DEBUG") return LogLevel::Debug;
    if (n == "INFO") return LogLevel::Info;
    if (n == "WARN" || n == "WARNING") return LogLevel::Warn;
    if (n == "ERROR") return LogLevel::Error;
    if (n == "OFF" || n == "NONE") return LogLevel::Off;
    return std::nullopt;
}

void log_debug(const std::string& msg) { write(LogLevel::Debug, "debug: ", msg); }
void log_info(const std::string& msg) { write(LogLevel::Info, "", msg); }
void log_warn(const std::string& msg) { write(LogLevel::Warn, "warning: ", msg); }
void log_error(const std::string& msg) { write(LogLevel::Error, "error: ", msg); }
