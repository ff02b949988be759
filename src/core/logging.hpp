#pragma once
#include <string>

namespace core {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Accepts "debug", "info", "warn", "error", "off" (case-insensitive). Returns false on unknown names.
bool parse_log_level(const std::string& name, LogLevel& out);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace core
