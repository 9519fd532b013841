#include "clfstat/report.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace clfstat {

Report build_report(const RunCounters& counters,
                    const Aggregator& agg,
                    const ReportLimits& limits) {
  Report r;
  r.counters = counters;
  r.top_clients = rank_clients(agg.clients(), limits.max_client_ips);
  r.top_paths = rank_paths(agg.paths(), limits.max_paths);
  return r;
}

static std::string format_kib(double v) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << v;
  return os.str();
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

void write_json_report(std::ostream& os, const Report& r) {
  os << "{\n";
  os << "    \"total_number_of_lines_processed\": " << r.counters.processed << ",\n";
  os << "    \"total_number_of_lines_ok\": " << r.counters.passed << ",\n";
  os << "    \"total_number_of_lines_failed\": " << r.counters.failed << ",\n";

  if (r.top_clients.empty()) {
    os << "    \"top_client_ips\": {},\n";
  } else {
    os << "    \"top_client_ips\": {\n";
    for (size_t i = 0; i < r.top_clients.size(); ++i) {
      os << "        \"" << json_escape(r.top_clients[i].first) << "\": "
         << r.top_clients[i].second
         << (i + 1 < r.top_clients.size() ? ",\n" : "\n");
    }
    os << "    },\n";
  }

  if (r.top_paths.empty()) {
    os << "    \"top_path_avg_response_size\": {}\n";
  } else {
    os << "    \"top_path_avg_response_size\": {\n";
    for (size_t i = 0; i < r.top_paths.size(); ++i) {
      os << "        \"" << json_escape(r.top_paths[i].first) << "\": "
         << format_kib(r.top_paths[i].second)
         << (i + 1 < r.top_paths.size() ? ",\n" : "\n");
    }
    os << "    }\n";
  }
  os << "}\n";
}

void write_text_report(std::ostream& os, const Report& r) {
  os << "\n=== REPORT ===\n";
  os << "Lines processed: " << r.counters.processed << "\n";
  os << "Lines ok: " << r.counters.passed << "\n";
  os << "Lines failed: " << r.counters.failed << "\n";

  os << "\nTop client IPs:\n";
  for (const auto& c : r.top_clients) {
    std::string addr = c.first;
    if (addr.size() < 16) addr.resize(16, ' ');
    os << "  " << addr << " " << c.second << "\n";
  }

  os << "\nTop paths by average response size (KiB):\n";
  for (const auto& p : r.top_paths) {
    os << "  " << format_kib(p.second) << "  " << p.first << "\n";
  }
}

} // namespace clfstat
