#include "clfstat/validators.hpp"

#include <cctype>
#include <cstring>
#include <limits>
#include <sstream>
#include <strings.h>
#include <time.h>
#include <vector>

#include "clfstat/tokenizer.hpp"

namespace clfstat {

static bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

static std::vector<std::string> split_on(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::string part;
  std::stringstream ss(s);
  while (std::getline(ss, part, sep)) parts.push_back(part);
  // getline drops a trailing empty part; "1.2.3." must still count as 4 parts
  if (!s.empty() && s.back() == sep) parts.push_back("");
  return parts;
}

bool valid_address(const std::string& token) {
  const std::vector<std::string> parts = split_on(token, '.');
  if (parts.size() != 4) return false;

  for (const auto& p : parts) {
    if (!all_digits(p)) return false;
    int v = 0;
    for (char c : p) {
      v = v * 10 + (c - '0');
      if (v > 255) return false;
    }
  }
  return true;
}

static bool digits_at(const std::string& s, size_t pos, size_t n) {
  if (pos + n > s.size()) return false;
  for (size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

// "DD/Mon/YYYY:HH:MM:SS +HHMM" or "... +HH:MM", zero-padded, English month.
static bool timestamp_shape(const std::string& s) {
  static const char* const kMonths[] = {
      "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  if (s.size() != 26 && s.size() != 27) return false;
  if (!digits_at(s, 0, 2) || s[2] != '/') return false;

  const std::string month = s.substr(3, 3);
  bool month_ok = false;
  for (const char* m : kMonths) {
    if (strcasecmp(month.c_str(), m) == 0) month_ok = true;
  }
  if (!month_ok || s[6] != '/') return false;

  if (!digits_at(s, 7, 4) || s[11] != ':' ||
      !digits_at(s, 12, 2) || s[14] != ':' ||
      !digits_at(s, 15, 2) || s[17] != ':' ||
      !digits_at(s, 18, 2) || s[20] != ' ') {
    return false;
  }

  if (s[21] != '+' && s[21] != '-') return false;
  if (s.size() == 26) return digits_at(s, 22, 4);
  return digits_at(s, 22, 2) && s[24] == ':' && digits_at(s, 25, 2);
}

bool valid_timestamp(const std::string& date_token, const std::string& zone_token) {
  const std::string joined = date_token + " " + zone_token;
  if (joined.front() != '[' || joined.back() != ']') return false;

  const std::string inner = joined.substr(1, joined.size() - 2);
  if (!timestamp_shape(inner)) return false;

  struct tm ts;
  std::memset(&ts, 0, sizeof(ts));

  const char* end = strptime(inner.c_str(), "%d/%b/%Y:%H:%M:%S %z", &ts);
  return end != nullptr && *end == '\0';
}

bool valid_method(const std::string& method) {
  static const char* const kMethods[] = {
      "OPTIONS", "GET", "HEAD", "POST", "PUT", "DELETE", "TRACE", "CONNECT", "PATCH"};
  for (const char* m : kMethods) {
    if (method == m) return true;
  }
  return false;
}

bool valid_protocol(const std::string& protocol) {
  const std::vector<std::string> parts = split_on(protocol, '/');
  if (parts.size() != 2 || parts[0] != "HTTP") return false;

  const std::vector<std::string> version = split_on(parts[1], '.');
  return version.size() == 2 && all_digits(version[0]) && all_digits(version[1]);
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Scans the UTF-8 sequence starting at s[i]. Returns whether it is well
// formed; `consumed` is its length, or for a bad sequence the lead byte plus
// the continuation bytes that were still acceptable (one U+FFFD covers them).
static bool scan_utf8(const std::string& s, size_t i, size_t& consumed) {
  const unsigned char c = static_cast<unsigned char>(s[i]);
  consumed = 1;
  if (c < 0x80) return true;

  size_t want = 0;
  unsigned char lo = 0x80, hi = 0xBF;  // allowed range of the second byte
  if (c >= 0xC2 && c <= 0xDF) {
    want = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    want = 3;
    if (c == 0xE0) lo = 0xA0;
    if (c == 0xED) hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    want = 4;
    if (c == 0xF0) lo = 0x90;
    if (c == 0xF4) hi = 0x8F;
  } else {
    return false;
  }

  while (consumed < want && i + consumed < s.size()) {
    const unsigned char b = static_cast<unsigned char>(s[i + consumed]);
    if (consumed == 1 ? (b < lo || b > hi) : (b < 0x80 || b > 0xBF)) break;
    ++consumed;
  }
  return consumed == want;
}

std::string to_valid_utf8(const std::string& s) {
  static const char kReplacement[] = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    size_t len = 0;
    if (scan_utf8(s, i, len)) out.append(s, i, len);
    else out += kReplacement;
    i += len;
  }
  return out;
}

std::string percent_decode(const std::string& s) {
  std::string out;
  out.reserve(s.size());

  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]);
      int lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(s[i]);
  }
  return to_valid_utf8(out);
}

std::optional<RequestLine> parse_request(const std::string& token) {
  std::vector<std::string> parts;
  if (!split_words(token, parts) || parts.size() != 3) return std::nullopt;

  if (!valid_method(parts[0])) return std::nullopt;
  if (!valid_protocol(parts[2])) return std::nullopt;

  RequestLine r;
  r.method = parts[0];
  r.path = percent_decode(parts[1]);
  r.protocol = parts[2];
  return r;
}

bool valid_status(const std::string& token) {
  return token.size() == 3 && all_digits(token) &&
         token[0] >= '2' && token[0] <= '5';
}

std::optional<std::uint64_t> parse_size(const std::string& token) {
  if (!all_digits(token)) return std::nullopt;

  const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t v = 0;
  for (char c : token) {
    const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
    if (v > (max - d) / 10) return std::nullopt;
    v = v * 10 + d;
  }
  return v;
}

// User agent grammar: (product)* (comment)*, scanned one whitespace-separated
// token at a time. A comment may open or close anywhere inside a token.
namespace {

enum class TokenKind { None, Product, Comment };

const char kNotInProduct[] = "(),:;<=>?@{}";

class AgentScanner {
public:
  bool feed(const std::string& token) {
    if (expects_product(token)) {
      if (token.find_first_of(kNotInProduct) != std::string::npos) return false;
      last_ = TokenKind::Product;
      return true;
    }

    for (char c : token) {
      if (c == '(') {
        ++depth_;
        last_ = TokenKind::Comment;
      } else if (c == ')') {
        if (depth_ == 0) return false;
        --depth_;
        last_ = TokenKind::Comment;
      }
    }
    return true;
  }

  bool finished() const { return depth_ == 0; }

private:
  bool expects_product(const std::string& token) const {
    switch (last_) {
      case TokenKind::None: return true;
      case TokenKind::Product: return token[0] != '(';
      case TokenKind::Comment: return depth_ == 0;
    }
    return false;
  }

  TokenKind last_ = TokenKind::None;
  int depth_ = 0;
};

} // namespace

bool valid_user_agent(const std::string& agent) {
  AgentScanner scanner;
  std::istringstream in(agent);
  std::string token;
  while (in >> token) {
    if (!scanner.feed(token)) return false;
  }
  return scanner.finished();
}

} // namespace clfstat
