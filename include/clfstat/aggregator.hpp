#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace clfstat {

struct PathStats {
  std::uint64_t count = 0;
  std::uint64_t total_size = 0;  // bytes, saturates at UINT64_MAX

  void add(std::uint64_t size);
};

// Running per-client and per-path totals for lines that passed validation.
// Nothing here is validated again.
class Aggregator {
public:
  void add(const std::string& address, const std::string& path, std::uint64_t size);

  const std::unordered_map<std::string, std::uint64_t>& clients() const { return by_client_; }
  const std::unordered_map<std::string, PathStats>& paths() const { return by_path_; }

private:
  std::unordered_map<std::string, std::uint64_t> by_client_;
  std::unordered_map<std::string, PathStats> by_path_;
};

} // namespace clfstat
