#pragma once

#include <istream>
#include <string>

#include "clfstat/aggregator.hpp"
#include "clfstat/counter_sink.hpp"
#include "clfstat/report.hpp"
#include "clfstat/types.hpp"

namespace clfstat {

// Counter names sent to the CounterSink, one "processed" plus one of
// "ok"/"failed" per line.
extern const char* const kCounterProcessed;
extern const char* const kCounterOk;
extern const char* const kCounterFailed;

// Everything one run accumulates. Owned by the caller.
struct RunContext {
  RunCounters counters;
  Aggregator aggregator;
};

// Tokenize, then address, timestamp, request, status, size, agent.
// Stops at the first failing field.
LineOutcome validate_line(const std::string& line);

// Validates one line and records it in ctx. Returns whether it passed.
bool process_line(const std::string& line, RunContext& ctx, CounterSink& sink);

// Reads `in` to the end. Returns false only on a read error.
bool process_stream(std::istream& in,
                    RunContext& ctx,
                    CounterSink& sink,
                    std::string* error_out = nullptr);

bool process_file(const std::string& path,
                  RunContext& ctx,
                  CounterSink& sink,
                  std::string* error_out = nullptr);

Report finish_run(const RunContext& ctx, const ReportLimits& limits);

} // namespace clfstat
