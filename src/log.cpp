#include "clfstat/log.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace clfstat {

static std::mutex g_log_mu;
static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "UNKNOWN";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  if (s == "DEBUG") out = LogLevel::Debug;
  else if (s == "INFO") out = LogLevel::Info;
  else if (s == "WARN" || s == "WARNING") out = LogLevel::Warn;
  else if (s == "ERROR" || s == "CRITICAL") out = LogLevel::Error;
  else return false;
  return true;
}

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level));
}

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= g_log_level.load();
}

void log_message(LogLevel level, const std::string& msg) {
  if (!log_enabled(level)) return;

  std::time_t now = std::time(nullptr);
  std::tm tm_buf;
  localtime_r(&now, &tm_buf);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << stamp << " [" << to_string(level) << "] " << msg << std::endl;
}

} // namespace clfstat
