#pragma once

#include <string>

namespace clfstat {

enum class LogLevel { Debug = 0, Info, Warn, Error };

const char* to_string(LogLevel level);

// "DEBUG", "INFO", "WARN" (or "WARNING"), "ERROR". "CRITICAL" maps to Error.
bool parse_log_level(const std::string& s, LogLevel& out);

void set_log_level(LogLevel level);
bool log_enabled(LogLevel level);

// Writes "YYYY-mm-dd HH:MM:SS [LEVEL] msg" to stderr.
void log_message(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log_message(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) { log_message(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg) { log_message(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { log_message(LogLevel::Error, msg); }

} // namespace clfstat
