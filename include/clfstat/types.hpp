#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace clfstat {

// Positions of the 9 tokens of a CLF line once quoting is respected.
enum Field : std::size_t {
  kAddress = 0,
  kIdentity,
  kUserId,
  kDate,      // "[10/Oct/2000:13:55:36"
  kTimezone,  // "-0700]"
  kRequest,
  kStatus,
  kSize,
  kAgent,
  kFieldCount
};

enum class LineError {
  None = 0,
  Malformed,   // tokenizer could not split the line
  FieldCount,  // not exactly kFieldCount tokens
  Address,
  Timestamp,
  Request,
  Status,
  Size,
  Agent
};

const char* to_string(LineError e);

// Result of validating one line. On success the derived values are the ones
// fed to the aggregator.
struct LineOutcome {
  LineError error = LineError::None;
  std::string detail;  // offending token, for logging

  std::string address;
  std::string path;  // percent-decoded
  std::uint64_t size = 0;

  bool ok() const { return error == LineError::None; }
};

struct RunCounters {
  std::uint64_t processed = 0;
  std::uint64_t passed = 0;
  std::uint64_t failed = 0;

  void add(bool ok) {
    ++processed;
    if (ok) ++passed;
    else ++failed;
  }
};

} // namespace clfstat
