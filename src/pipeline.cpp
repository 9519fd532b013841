#include "clfstat/pipeline.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <utility>
#include <vector>

#include "clfstat/log.hpp"
#include "clfstat/tokenizer.hpp"
#include "clfstat/validators.hpp"

namespace clfstat {

const char* const kCounterProcessed = "lines.processed";
const char* const kCounterOk = "lines.ok";
const char* const kCounterFailed = "lines.failed";

const char* to_string(LineError e) {
  switch (e) {
    case LineError::None: return "ok";
    case LineError::Malformed: return "malformed line";
    case LineError::FieldCount: return "wrong field count";
    case LineError::Address: return "invalid client address";
    case LineError::Timestamp: return "invalid timestamp";
    case LineError::Request: return "invalid request line";
    case LineError::Status: return "invalid status code";
    case LineError::Size: return "invalid response size";
    case LineError::Agent: return "invalid user agent";
  }
  return "unknown";
}

static LineOutcome fail(LineError e, std::string detail) {
  LineOutcome out;
  out.error = e;
  out.detail = std::move(detail);
  return out;
}

static std::string short_line_preview(const std::string& line) {
  const size_t max_len = 160;
  if (line.size() <= max_len) return line;
  return line.substr(0, max_len) + "...";
}

LineOutcome validate_line(const std::string& line) {
  std::vector<std::string> f;
  std::string err;

  const LineError tok = tokenize_line(line, f, &err);
  if (tok != LineError::None) return fail(tok, err);

  if (!valid_address(f[kAddress])) return fail(LineError::Address, f[kAddress]);

  // identity and userid carry no constraints

  if (!valid_timestamp(f[kDate], f[kTimezone])) {
    return fail(LineError::Timestamp, f[kDate] + " " + f[kTimezone]);
  }

  std::optional<RequestLine> req = parse_request(f[kRequest]);
  if (!req) return fail(LineError::Request, f[kRequest]);

  if (!valid_status(f[kStatus])) return fail(LineError::Status, f[kStatus]);

  std::optional<std::uint64_t> size = parse_size(f[kSize]);
  if (!size) return fail(LineError::Size, f[kSize]);

  if (!valid_user_agent(f[kAgent])) return fail(LineError::Agent, f[kAgent]);

  LineOutcome out;
  out.address = f[kAddress];
  out.path = std::move(req->path);
  out.size = *size;
  return out;
}

bool process_line(const std::string& line, RunContext& ctx, CounterSink& sink) {
  const LineOutcome r = validate_line(line);

  ctx.counters.add(r.ok());
  sink.increment(kCounterProcessed);
  sink.increment(r.ok() ? kCounterOk : kCounterFailed);

  if (!r.ok()) {
    log_error(std::string(to_string(r.error)) + ": \"" + short_line_preview(r.detail) +
              "\". Continuing to next line.");
    return false;
  }

  if (log_enabled(LogLevel::Debug)) {
    log_debug("ok: " + r.address + " " + r.path + " " + std::to_string(r.size));
  }
  ctx.aggregator.add(r.address, r.path, r.size);
  return true;
}

bool process_stream(std::istream& in,
                    RunContext& ctx,
                    CounterSink& sink,
                    std::string* error_out) {
  std::string line;
  while (std::getline(in, line)) {
    process_line(line, ctx, sink);
  }

  if (in.bad()) {
    if (error_out) {
      *error_out = "Read error after line " + std::to_string(ctx.counters.processed) + ".";
    }
    return false;
  }
  return true;
}

bool process_file(const std::string& path,
                  RunContext& ctx,
                  CounterSink& sink,
                  std::string* error_out) {
  std::ifstream in(path);
  if (!in) {
    if (error_out) *error_out = "Failed to open file: " + path;
    return false;
  }

  std::string err;
  if (!process_stream(in, ctx, sink, &err)) {
    if (error_out) *error_out = path + ": " + err;
    return false;
  }

  log_info("Total lines processed = " + std::to_string(ctx.counters.processed));
  log_info("Total lines failed = " + std::to_string(ctx.counters.failed));
  log_info("Total lines OK = " + std::to_string(ctx.counters.passed));
  return true;
}

Report finish_run(const RunContext& ctx, const ReportLimits& limits) {
  return build_report(ctx.counters, ctx.aggregator, limits);
}

} // namespace clfstat
