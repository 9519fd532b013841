#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace clfstat {

// Dotted-quad IPv4 address; each of the 4 components is digits only, 0..255.
bool valid_address(const std::string& token);

// CLF timestamp split across two tokens: "[10/Oct/2000:13:55:36" "-0700]".
bool valid_timestamp(const std::string& date_token, const std::string& zone_token);

struct RequestLine {
  std::string method;
  std::string path;  // percent-decoded
  std::string protocol;
};

// "GET /index.html HTTP/1.1". Returns the parsed request with its path
// decoded, or nullopt when the method, shape or protocol is wrong.
std::optional<RequestLine> parse_request(const std::string& token);

bool valid_method(const std::string& method);
bool valid_protocol(const std::string& protocol);

// Decodes %XX escapes. Malformed escapes are kept as they are. Byte runs
// that are not valid UTF-8 afterwards become U+FFFD.
std::string percent_decode(const std::string& s);

// Replaces each ill-formed UTF-8 subsequence with U+FFFD.
std::string to_valid_utf8(const std::string& s);

// Three digits, first one of 2, 3, 4, 5.
bool valid_status(const std::string& token);

std::optional<std::uint64_t> parse_size(const std::string& token);

// Product tokens followed by parenthesized, possibly nested comments.
bool valid_user_agent(const std::string& agent);

} // namespace clfstat
