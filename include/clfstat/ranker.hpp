#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "clfstat/aggregator.hpp"

namespace clfstat {

using ClientRank = std::vector<std::pair<std::string, std::uint64_t>>;
using PathRank = std::vector<std::pair<std::string, double>>;

// Highest hit counts first; equal counts in ascending address order.
// At most `limit` entries.
ClientRank rank_clients(const std::unordered_map<std::string, std::uint64_t>& clients,
                        std::size_t limit);

// Average response size per path in KiB, largest first (ties by path),
// at most `limit` entries. Averages are rounded to 2 decimals only after
// the cut so rounding never changes which paths are kept.
PathRank rank_paths(const std::unordered_map<std::string, PathStats>& paths,
                    std::size_t limit);

double average_kib(const PathStats& s);
double round2(double v);

} // namespace clfstat
