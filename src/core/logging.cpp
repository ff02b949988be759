#include "core/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex;

bool enabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel get_log_level() { return static_cast<LogLevel>(g_level.load()); }

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "info")  { out = LogLevel::Info;  return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    if (lower == "off")   { out = LogLevel::Off;   return true; }
    return false;
}

void log_debug(const std::string& msg) {
    if (!enabled(LogLevel::Debug)) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[DEBUG] " << msg << std::endl;
}

void log_info(const std::string& msg) {
    if (!enabled(LogLevel::Info)) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[INFO] " << msg << std::endl;
}

void log_warn(const std::string& msg) {
    if (!enabled(LogLevel::Warn)) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[WARN] " << msg << std::endl;
}

void log_error(const std::string& msg) {
    if (!enabled(LogLevel::Error)) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[ERROR] " << msg << std::endl;
}

} // namespace core
