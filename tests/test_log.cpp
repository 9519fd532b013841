// tests/test_log.cpp
#include <iostream>

#include "clfstat/log.hpp"

int main() {
  using namespace clfstat;

  struct Case {
    const char* name;
    LogLevel expected;
  };
  const Case cases[] = {
      {"DEBUG", LogLevel::Debug}, {"INFO", LogLevel::Info},   {"WARN", LogLevel::Warn},
      {"WARNING", LogLevel::Warn}, {"ERROR", LogLevel::Error}, {"CRITICAL", LogLevel::Error},
  };
  for (const auto& c : cases) {
    LogLevel l = LogLevel::Debug;
    if (!parse_log_level(c.name, l) || l != c.expected) {
      std::cerr << "log level " << c.name << " parsed wrong\n";
      return 1;
    }
  }

  LogLevel l = LogLevel::Info;
  if (parse_log_level("debug", l) || parse_log_level("VERBOSE", l) || parse_log_level("", l)) {
    std::cerr << "invalid log level accepted\n";
    return 2;
  }

  set_log_level(LogLevel::Warn);
  if (log_enabled(LogLevel::Info) || !log_enabled(LogLevel::Warn) || !log_enabled(LogLevel::Error)) {
    std::cerr << "level filter wrong\n";
    return 3;
  }

  std::cout << "test_log: OK\n";
  return 0;
}
