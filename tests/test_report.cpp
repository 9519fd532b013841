// tests/test_report.cpp
#include <iostream>
#include <sstream>
#include <string>

#include "clfstat/report.hpp"
#include "clfstat/validators.hpp"

int main() {
  using namespace clfstat;

  if (json_escape("a\"b\\c\n\x01") != "a\\\"b\\\\c\\n\\u0001") {
    std::cerr << "json_escape wrong: " << json_escape("a\"b\\c\n\x01") << "\n";
    return 1;
  }

  Aggregator agg;
  agg.add("1.1.1.1", "/x", 1024);
  agg.add("1.1.1.1", "/y", 3072);
  agg.add("2.2.2.2", "/y", 1024);

  RunCounters c;
  c.add(true);
  c.add(true);
  c.add(true);
  c.add(false);

  ReportLimits limits;
  limits.max_client_ips = 1;
  limits.max_paths = 10;
  Report r = build_report(c, agg, limits);

  if (r.top_clients.size() != 1 || r.top_paths.size() != 2) {
    std::cerr << "limits not applied\n";
    return 2;
  }

  std::ostringstream os;
  write_json_report(os, r);
  const std::string expected =
      "{\n"
      "    \"total_number_of_lines_processed\": 4,\n"
      "    \"total_number_of_lines_ok\": 3,\n"
      "    \"total_number_of_lines_failed\": 1,\n"
      "    \"top_client_ips\": {\n"
      "        \"1.1.1.1\": 2\n"
      "    },\n"
      "    \"top_path_avg_response_size\": {\n"
      "        \"/y\": 2.00,\n"
      "        \"/x\": 1.00\n"
      "    }\n"
      "}\n";
  if (os.str() != expected) {
    std::cerr << "unexpected JSON:\n" << os.str() << "\n";
    return 3;
  }

  limits.max_client_ips = 0;
  limits.max_paths = 0;
  std::ostringstream empty;
  write_json_report(empty, build_report(c, agg, limits));
  if (empty.str().find("\"top_client_ips\": {},") == std::string::npos ||
      empty.str().find("\"top_path_avg_response_size\": {}\n") == std::string::npos) {
    std::cerr << "empty maps not rendered as {}:\n" << empty.str() << "\n";
    return 4;
  }

  std::ostringstream text;
  write_text_report(text, r);
  if (text.str().find("Lines processed: 4") == std::string::npos ||
      text.str().find("/y") == std::string::npos) {
    std::cerr << "text report missing data:\n" << text.str() << "\n";
    return 5;
  }

  // writers leave the caller's stream formatting alone
  std::ostringstream plain;
  write_json_report(plain, r);
  write_text_report(plain, r);
  if (plain.flags() != std::ostringstream().flags() || plain.precision() != 6) {
    std::cerr << "report writers changed stream flags\n";
    return 6;
  }

  // a path decoded from an invalid UTF-8 escape still yields valid UTF-8 JSON
  Aggregator bad_utf8;
  bad_utf8.add("3.3.3.3", percent_decode("/%FF"), 1024);
  ReportLimits all;
  std::ostringstream js;
  write_json_report(js, build_report(c, bad_utf8, all));
  if (js.str().find("\"/\xEF\xBF\xBD\": 1.00") == std::string::npos ||
      js.str().find('\xFF') != std::string::npos) {
    std::cerr << "invalid UTF-8 leaked into JSON:\n" << js.str() << "\n";
    return 7;
  }

  std::cout << "test_report: OK\n";
  return 0;
}
