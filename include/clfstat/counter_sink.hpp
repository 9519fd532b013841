#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace clfstat {

// Fire-and-forget named counters. Implementations must never fail the caller.
class CounterSink {
public:
  virtual ~CounterSink() = default;
  virtual void increment(const std::string& name) = 0;
};

class NullCounterSink : public CounterSink {
public:
  void increment(const std::string&) override {}
};

// Sends "<prefix><name>:1|c" datagrams to a StatsD server over UDP.
class StatsdCounterSink : public CounterSink {
public:
  explicit StatsdCounterSink(std::string prefix = "clfstat.");
  ~StatsdCounterSink() override;

  StatsdCounterSink(const StatsdCounterSink&) = delete;
  StatsdCounterSink& operator=(const StatsdCounterSink&) = delete;

  bool open(const std::string& host, std::uint16_t port, std::string* error_out = nullptr);
  bool is_open() const { return fd_ >= 0; }

  void increment(const std::string& name) override;

private:
  std::string prefix_;
  int fd_ = -1;
};

// "host:port" with a numeric port in 1..65535.
bool parse_host_port(const std::string& s, std::string& host, std::uint16_t& port);

// Builds a StatsD sink from STATSD_SERVER, or a NullCounterSink when it is
// unset, malformed or unreachable. Problems are logged, never fatal.
std::unique_ptr<CounterSink> make_counter_sink_from_env();

} // namespace clfstat
