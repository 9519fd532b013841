// tests/test_tokenizer.cpp
#include <iostream>
#include <string>
#include <vector>

#include "clfstat/tokenizer.hpp"

using clfstat::LineError;

int main() {
  std::vector<std::string> w;
  std::string err;

  // quoted fields stay whole, brackets do not group
  std::string line =
      R"x(10.0.0.1 - - [10/Oct/2000:13:55:36 -0700] "GET /a b.html HTTP/1.1" 200 512 "Mozilla/5.0 (X11; Linux x86_64)")x";
  if (!clfstat::split_words(line, w, &err) || w.size() != 9) {
    std::cerr << "expected 9 words, got " << w.size() << " err=" << err << "\n";
    return 1;
  }
  if (w[3] != "[10/Oct/2000:13:55:36" || w[4] != "-0700]") {
    std::cerr << "timestamp split wrong: " << w[3] << " | " << w[4] << "\n";
    return 2;
  }
  if (w[5] != "GET /a b.html HTTP/1.1" || w[8] != "Mozilla/5.0 (X11; Linux x86_64)") {
    std::cerr << "quotes not stripped: " << w[5] << " | " << w[8] << "\n";
    return 3;
  }

  // adjacent quoted and bare parts join, empty quotes give an empty word
  if (!clfstat::split_words(R"(a"b c"d '' e)", w) || w.size() != 3 ||
      w[0] != "ab cd" || !w[1].empty() || w[2] != "e") {
    std::cerr << "joining / empty word handling wrong\n";
    return 4;
  }

  // escapes
  if (!clfstat::split_words(R"("say \"hi\" \n" a\ b 'x\y')", w) || w.size() != 3 ||
      w[0] != R"(say "hi" \n)" || w[1] != "a b" || w[2] != R"(x\y)") {
    std::cerr << "escape handling wrong\n";
    return 5;
  }

  // trailing CR/LF are separators
  if (!clfstat::split_words("one two\r\n", w) || w.size() != 2 || w[1] != "two") {
    std::cerr << "CRLF handling wrong\n";
    return 6;
  }

  if (clfstat::split_words(R"(a "unterminated)", w, &err)) {
    std::cerr << "unbalanced double quote accepted\n";
    return 7;
  }
  if (clfstat::split_words("a 'b", w)) {
    std::cerr << "unbalanced single quote accepted\n";
    return 8;
  }
  if (clfstat::split_words("a b\\", w)) {
    std::cerr << "trailing backslash accepted\n";
    return 9;
  }

  if (clfstat::tokenize_line(line, w) != LineError::None) {
    std::cerr << "tokenize_line rejected a good line\n";
    return 10;
  }
  if (clfstat::tokenize_line(R"(1.2.3.4 - - "open)", w) != LineError::Malformed) {
    std::cerr << "expected Malformed\n";
    return 11;
  }
  if (clfstat::tokenize_line("1.2.3.4 - - [x] \"GET / HTTP/1.1\" 200 10", w) != LineError::FieldCount) {
    std::cerr << "expected FieldCount\n";
    return 12;
  }
  if (clfstat::tokenize_line("", w) != LineError::FieldCount || !w.empty()) {
    std::cerr << "empty line should be a FieldCount failure\n";
    return 13;
  }

  std::cout << "test_tokenizer: OK\n";
  return 0;
}
