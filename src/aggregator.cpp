#include "clfstat/aggregator.hpp"

#include <limits>

namespace clfstat {

void PathStats::add(std::uint64_t size) {
  ++count;
  // saturate instead of wrapping
  const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
  total_size = size > max - total_size ? max : total_size + size;
}

void Aggregator::add(const std::string& address, const std::string& path, std::uint64_t size) {
  ++by_client_[address];
  by_path_[path].add(size);
}

} // namespace clfstat
