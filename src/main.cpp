#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

#include "clfstat/counter_sink.hpp"
#include "clfstat/log.hpp"
#include "clfstat/pipeline.hpp"
#include "clfstat/report.hpp"

static const char* kVersion = "1.0";

struct Options {
  std::string in_path;
  std::string out_path;
  clfstat::ReportLimits limits;
  std::string format = "json";
  bool verbose = false;
};

static void print_usage(std::ostream& os) {
  os << "Usage:\n"
     << "  clfstat --in <path> [--out <path>] [--max-client-ips N] [--max-paths N]\n"
     << "          [--format json|text] [--verbose]\n"
     << "  clfstat --help\n"
     << "  clfstat --version\n"
     << "\n"
     << "Options:\n"
     << "  -i, --in <path>             Input access log (Common Log Format).\n"
     << "  -o, --out <path>            Write the report to a file instead of stdout.\n"
     << "  -c, --max-client-ips N      Entries in top_client_ips, 0..10000 (default 10).\n"
     << "  -p, --max-paths N           Entries in top_path_avg_response_size, 0..10000 (default 10).\n"
     << "  -f, --format json|text      Output format (default json).\n"
     << "  -v, --verbose               Debug logging (overrides CLFSTAT_LOG_LEVEL).\n"
     << "  -h, --help                  Print this help.\n"
     << "      --version               Print version.\n"
     << "\n"
     << "Environment:\n"
     << "  CLFSTAT_LOG_LEVEL           DEBUG, INFO, WARN, ERROR or CRITICAL (default INFO).\n"
     << "  STATSD_SERVER               host:port of a StatsD server for line counters.\n"
     << "\n"
     << "Examples:\n"
     << "  clfstat --in access.log\n"
     << "  clfstat --in access.log --out report.json --max-client-ips 5 --max-paths 20\n";
}

static bool parse_int(const std::string& s, int& out) {
  try {
    size_t idx = 0;
    int v = std::stoi(s, &idx, 10);
    if (idx != s.size()) return false;
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static bool parse_limit(const std::string& flag, const std::string& value, std::size_t& out) {
  int v = 0;
  if (!parse_int(value, v) || v < 0 || static_cast<std::size_t>(v) > clfstat::kMaxLimit) {
    clfstat::log_error("Value of " + value + " for " + flag + " is not between 0 and " +
                       std::to_string(clfstat::kMaxLimit));
    return false;
  }
  out = static_cast<std::size_t>(v);
  clfstat::log_info(flag + " is set to " + std::to_string(out));
  return true;
}

static void init_log_level() {
  const char* env = std::getenv("CLFSTAT_LOG_LEVEL");
  clfstat::LogLevel level = clfstat::LogLevel::Info;
  if (env == nullptr) {
    std::cerr << "CLFSTAT_LOG_LEVEL is not set. Defaulting to INFO.\n";
  } else if (!clfstat::parse_log_level(env, level)) {
    std::cerr << "Value of " << env << " in CLFSTAT_LOG_LEVEL is not a valid log level. "
              << "Defaulting to INFO.\n";
    level = clfstat::LogLevel::Info;
  }
  clfstat::set_log_level(level);
}

// Returns 0 to continue, otherwise the process exit code.
static int parse_args(int argc, char** argv, Options& opt) {
  bool ok = true;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    const bool has_value = i + 1 < argc;

    if (a == "--help" || a == "-h") {
      print_usage(std::cout);
      return -1;
    }
    if (a == "--version") {
      std::cout << "clfstat v" << kVersion << "\n";
      return -1;
    }
    if (a == "--verbose" || a == "-v") {
      opt.verbose = true;
      continue;
    }
    if ((a == "--in" || a == "-i") && has_value) {
      opt.in_path = argv[++i];
      continue;
    }
    if ((a == "--out" || a == "-o") && has_value) {
      opt.out_path = argv[++i];
      continue;
    }
    if ((a == "--max-client-ips" || a == "-c") && has_value) {
      ok = parse_limit("max-client-ips", argv[++i], opt.limits.max_client_ips) && ok;
      continue;
    }
    if ((a == "--max-paths" || a == "-p") && has_value) {
      ok = parse_limit("max-paths", argv[++i], opt.limits.max_paths) && ok;
      continue;
    }
    if ((a == "--format" || a == "-f") && has_value) {
      opt.format = argv[++i];
      if (opt.format != "json" && opt.format != "text") {
        std::cerr << "Invalid --format. Use: json or text\n";
        ok = false;
      }
      continue;
    }

    std::cerr << "Unknown or incomplete argument: " << a << "\n";
    print_usage(std::cerr);
    return 1;
  }

  if (opt.in_path.empty()) {
    std::cerr << "Missing --in <path>\n";
    return 1;
  }

  return ok ? 0 : 1;
}

static bool check_files(const Options& opt) {
  bool ok = true;

  struct stat st;
  if (::stat(opt.in_path.c_str(), &st) != 0) {
    clfstat::log_error("Cannot find input file: " + opt.in_path);
    ok = false;
  } else if (::access(opt.in_path.c_str(), R_OK) != 0) {
    clfstat::log_error("No read access to input file: " + opt.in_path);
    ok = false;
  } else {
    clfstat::log_info("Input file to be parsed is: " + opt.in_path);
  }

  if (!opt.out_path.empty()) {
    if (::stat(opt.out_path.c_str(), &st) == 0) {
      clfstat::log_warn("Output file already exists and will be overwritten: " + opt.out_path);
    }
    std::ofstream probe(opt.out_path, std::ios::out | std::ios::app);
    if (!probe) {
      clfstat::log_error("Output file cannot be opened for writing: " + opt.out_path);
      ok = false;
    } else {
      clfstat::log_info("Output file for the report is: " + opt.out_path);
    }
  }
  return ok;
}

int main(int argc, char** argv) {
  init_log_level();

  Options opt;
  int rc = parse_args(argc, argv, opt);
  if (rc < 0) return 0;
  if (rc != 0) {
    clfstat::log_error("Error found with command line arguments. Exiting.");
    return rc;
  }

  if (opt.verbose) {
    clfstat::log_warn("Changing log level to DEBUG since --verbose was given.");
    clfstat::set_log_level(clfstat::LogLevel::Debug);
  }

  clfstat::log_info("Log parser is starting.");
  if (!check_files(opt)) return 1;

  std::unique_ptr<clfstat::CounterSink> sink = clfstat::make_counter_sink_from_env();

  clfstat::RunContext ctx;
  std::string err;
  if (!clfstat::process_file(opt.in_path, ctx, *sink, &err)) {
    std::cerr << "Error: " << err << "\n";
    return 1;
  }

  const clfstat::Report report = clfstat::finish_run(ctx, opt.limits);

  std::ostringstream rendered;
  if (opt.format == "json") {
    clfstat::write_json_report(rendered, report);
  } else {
    rendered << "clfstat v" << kVersion << "\n";
    clfstat::write_text_report(rendered, report);
  }
  clfstat::log_debug("Report:\n" + rendered.str());

  std::ofstream fout;
  std::ostream* out = &std::cout;

  if (!opt.out_path.empty()) {
    fout.open(opt.out_path, std::ios::out | std::ios::trunc);
    if (!fout) {
      std::cerr << "Error: Failed to open output file: " << opt.out_path << "\n";
      return 1;
    }
    out = &fout;
  }

  *out << rendered.str();
  out->flush();
  if (!*out) {
    std::cerr << "Error: Failed to write report"
              << (opt.out_path.empty() ? std::string() : " to " + opt.out_path) << "\n";
    return 1;
  }

  clfstat::log_info("The log parser is done.");
  return 0;
}
