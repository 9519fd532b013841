#include "clfstat/ranker.hpp"

#include <algorithm>
#include <cmath>

namespace clfstat {

namespace {

template <typename V>
void sort_and_cut(std::vector<std::pair<std::string, V>>& v, std::size_t limit) {
  std::sort(v.begin(), v.end(), [](const auto& a, const auto& b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first < b.first;
  });
  if (v.size() > limit) v.resize(limit);
}

} // namespace

double average_kib(const PathStats& s) {
  if (s.count == 0) return 0.0;
  return (static_cast<double>(s.total_size) / static_cast<double>(s.count)) / 1024.0;
}

// Ties go to the even neighbour (default FE_TONEAREST), so 0.125 -> 0.12.
double round2(double v) {
  return std::nearbyint(v * 100.0) / 100.0;
}

ClientRank rank_clients(const std::unordered_map<std::string, std::uint64_t>& clients,
                        std::size_t limit) {
  ClientRank out(clients.begin(), clients.end());
  sort_and_cut(out, limit);
  return out;
}

PathRank rank_paths(const std::unordered_map<std::string, PathStats>& paths,
                    std::size_t limit) {
  PathRank out;
  out.reserve(paths.size());
  for (const auto& kv : paths) {
    out.push_back({kv.first, average_kib(kv.second)});
  }

  sort_and_cut(out, limit);

  for (auto& p : out) p.second = round2(p.second);
  return out;
}

} // namespace clfstat
