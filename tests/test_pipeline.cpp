// tests/test_pipeline.cpp
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "clfstat/log.hpp"
#include "clfstat/pipeline.hpp"

struct RecordingSink : public clfstat::CounterSink {
  std::map<std::string, int> counts;
  void increment(const std::string& name) override { ++counts[name]; }
};

static const char* kGood1 =
    R"x(10.0.0.1 - - [10/Oct/2000:13:55:36 -0700] "GET /index.html HTTP/1.1" 200 1024 "Mozilla/5.0 (X11; Linux x86_64)")x";
static const char* kGood2 =
    R"(10.0.0.1 - frank [10/Oct/2000:13:55:40 -0700] "POST /api%2Fv1 HTTP/1.0" 201 3072 "curl/7.68.0")";
static const char* kBadStatus =
    R"(10.0.0.2 - - [10/Oct/2000:13:55:41 -0700] "GET /index.html HTTP/1.1" 700 10 "curl/7.68.0")";

int main() {
  using namespace clfstat;
  set_log_level(LogLevel::Error);

  // one outcome per failure kind
  struct Case {
    std::string line;
    LineError expected;
  };
  const Case cases[] = {
      {kGood1, LineError::None},
      {R"(10.0.0.1 - - [10/Oct/2000:13:55:36 -0700] "GET / HTTP/1.1 200 1 "x")", LineError::Malformed},
      {"10.0.0.1 - - [10/Oct/2000:13:55:36 -0700] \"GET / HTTP/1.1\" 200 1", LineError::FieldCount},
      {R"(10.0.0.300 - - [10/Oct/2000:13:55:36 -0700] "GET / HTTP/1.1" 200 1 "x")", LineError::Address},
      {R"(10.0.0.1 - - 10/Oct/2000:13:55:36 -0700 "GET / HTTP/1.1" 200 1 "x")", LineError::Timestamp},
      {R"(10.0.0.1 - - [10/Oct/2000:13:55:36 -0700] "BREW / HTTP/1.1" 200 1 "x")", LineError::Request},
      {kBadStatus, LineError::Status},
      {R"(10.0.0.1 - - [10/Oct/2000:13:55:36 -0700] "GET / HTTP/1.1" 200 - "x")", LineError::Size},
      {R"(10.0.0.1 - - [10/Oct/2000:13:55:36 -0700] "GET / HTTP/1.1" 200 1 "x (y")", LineError::Agent},
  };
  for (const auto& c : cases) {
    LineOutcome o = validate_line(c.line);
    if (o.error != c.expected) {
      std::cerr << "line: " << c.line << "\n  expected " << to_string(c.expected)
                << " got " << to_string(o.error) << "\n";
      return 1;
    }
  }

  LineOutcome ok = validate_line(kGood2);
  if (!ok.ok() || ok.address != "10.0.0.1" || ok.path != "/api/v1" || ok.size != 3072) {
    std::cerr << "derived values wrong: " << ok.address << " " << ok.path << " " << ok.size << "\n";
    return 2;
  }

  // end to end: 2 good lines from one client on two paths, 1 bad status
  std::istringstream in(std::string(kGood1) + "\n" + kGood2 + "\n" + kBadStatus + "\n");
  RunContext ctx;
  RecordingSink sink;
  std::string err;
  if (!process_stream(in, ctx, sink, &err)) {
    std::cerr << "process_stream failed: " << err << "\n";
    return 3;
  }
  if (ctx.counters.processed != 3 || ctx.counters.passed != 2 || ctx.counters.failed != 1) {
    std::cerr << "counters wrong: " << ctx.counters.processed << "/" << ctx.counters.passed
              << "/" << ctx.counters.failed << "\n";
    return 4;
  }
  if (sink.counts[kCounterProcessed] != 3 || sink.counts[kCounterOk] != 2 ||
      sink.counts[kCounterFailed] != 1) {
    std::cerr << "counter sink signals wrong\n";
    return 5;
  }

  ReportLimits limits;
  limits.max_paths = 2;
  Report r = finish_run(ctx, limits);
  if (r.top_clients.size() != 1 || r.top_clients[0].first != "10.0.0.1" ||
      r.top_clients[0].second != 2) {
    std::cerr << "top clients wrong\n";
    return 6;
  }
  if (r.top_paths.size() != 2 || r.top_paths[0].first != "/api/v1" || r.top_paths[0].second != 3.0 ||
      r.top_paths[1].first != "/index.html" || r.top_paths[1].second != 1.0) {
    std::cerr << "top paths wrong\n";
    return 7;
  }

  // N lines from the same client
  RunContext same;
  NullCounterSink null_sink;
  for (int i = 0; i < 40; ++i) process_line(kGood1, same, null_sink);
  if (same.aggregator.clients().at("10.0.0.1") != 40 || same.counters.passed != 40) {
    std::cerr << "repeated client count wrong\n";
    return 8;
  }

  // blank lines are processed and fail
  std::istringstream blanks("\n\n");
  RunContext b;
  process_stream(blanks, b, null_sink);
  if (b.counters.processed != 2 || b.counters.failed != 2) {
    std::cerr << "blank lines should count as failed\n";
    return 9;
  }

  if (process_file("/nonexistent/clfstat/input.log", b, null_sink, &err) || err.empty()) {
    std::cerr << "missing file should fail with a message\n";
    return 10;
  }

  std::cout << "test_pipeline: OK\n";
  return 0;
}
