#include "clfstat/counter_sink.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "clfstat/log.hpp"

namespace clfstat {

StatsdCounterSink::StatsdCounterSink(std::string prefix)
    : prefix_(std::move(prefix)) {}

StatsdCounterSink::~StatsdCounterSink() {
  if (fd_ >= 0) ::close(fd_);
}

bool StatsdCounterSink::open(const std::string& host, std::uint16_t port, std::string* error_out) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  if (rc != 0) {
    if (error_out) *error_out = "Cannot resolve " + host + ": " + gai_strerror(rc);
    return false;
  }

  int fd = -1;
  for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    // connect() on UDP only fixes the peer so send() can be used.
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);

  if (fd < 0) {
    if (error_out) *error_out = "Cannot open UDP socket to " + host + ":" + port_str;
    return false;
  }

  if (fd_ >= 0) ::close(fd_);
  fd_ = fd;
  return true;
}

void StatsdCounterSink::increment(const std::string& name) {
  if (fd_ < 0) return;

  const std::string payload = prefix_ + name + ":1|c";
  if (::send(fd_, payload.data(), payload.size(), 0) < 0 && log_enabled(LogLevel::Debug)) {
    log_debug("statsd send failed for " + name + ": " + std::strerror(errno));
  }
}

bool parse_host_port(const std::string& s, std::string& host, std::uint16_t& port) {
  const size_t colon = s.find(':');
  if (colon == std::string::npos || colon == 0 || s.find(':', colon + 1) != std::string::npos) {
    return false;
  }

  const std::string port_str = s.substr(colon + 1);
  if (port_str.empty() || port_str.size() > 5) return false;
  unsigned long v = 0;
  for (char c : port_str) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<unsigned long>(c - '0');
  }
  if (v == 0 || v > 65535) return false;

  host = s.substr(0, colon);
  port = static_cast<std::uint16_t>(v);
  return true;
}

std::unique_ptr<CounterSink> make_counter_sink_from_env() {
  const char* env = std::getenv("STATSD_SERVER");
  if (env == nullptr || *env == '\0') {
    log_info("No STATSD_SERVER environment variable found. Continuing without statsd.");
    return std::make_unique<NullCounterSink>();
  }

  std::string host;
  std::uint16_t port = 0;
  if (!parse_host_port(env, host, port)) {
    log_error(std::string("STATSD_SERVER is not a valid host:port: ") + env);
    return std::make_unique<NullCounterSink>();
  }

  auto sink = std::make_unique<StatsdCounterSink>();
  std::string err;
  if (!sink->open(host, port, &err)) {
    log_error(err + ". Continuing without statsd.");
    return std::make_unique<NullCounterSink>();
  }

  log_info("statsd host is " + host + " and port is " + std::to_string(port));
  return sink;
}

} // namespace clfstat
