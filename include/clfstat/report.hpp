#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "clfstat/aggregator.hpp"
#include "clfstat/ranker.hpp"
#include "clfstat/types.hpp"

namespace clfstat {

struct ReportLimits {
  std::size_t max_client_ips = 10;
  std::size_t max_paths = 10;
};

// Upper bound accepted for either limit on the command line.
constexpr std::size_t kMaxLimit = 10000;

struct Report {
  RunCounters counters;
  ClientRank top_clients;
  PathRank top_paths;
};

Report build_report(const RunCounters& counters,
                    const Aggregator& agg,
                    const ReportLimits& limits);

std::string json_escape(const std::string& s);

void write_json_report(std::ostream& os, const Report& r);
void write_text_report(std::ostream& os, const Report& r);

} // namespace clfstat
