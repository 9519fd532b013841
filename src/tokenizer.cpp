#include "clfstat/tokenizer.hpp"

namespace clfstat {

static bool is_separator(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool split_words(const std::string& text,
                 std::vector<std::string>& out,
                 std::string* err) {
  out.clear();

  std::string word;
  word.reserve(text.size());

  // A word exists once any part of it was seen, so "" yields an empty word.
  bool in_word = false;
  char quote = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];

    if (quote == '\'') {
      if (c == '\'') quote = 0;
      else word.push_back(c);
      continue;
    }

    if (quote == '"') {
      if (c == '"') {
        quote = 0;
      } else if (c == '\\' && i + 1 < text.size() &&
                 (text[i + 1] == '"' || text[i + 1] == '\\')) {
        word.push_back(text[++i]);
      } else {
        word.push_back(c);
      }
      continue;
    }

    if (is_separator(c)) {
      if (in_word) {
        out.push_back(word);
        word.clear();
        in_word = false;
      }
      continue;
    }

    in_word = true;

    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }

    if (c == '\\') {
      if (i + 1 >= text.size()) {
        if (err) *err = "No escaped character.";
        return false;
      }
      word.push_back(text[++i]);
      continue;
    }

    word.push_back(c);
  }

  if (quote) {
    if (err) *err = "No closing quotation.";
    return false;
  }

  if (in_word) out.push_back(word);
  return true;
}

LineError tokenize_line(const std::string& line,
                        std::vector<std::string>& fields,
                        std::string* err) {
  if (!split_words(line, fields, err)) return LineError::Malformed;

  if (fields.size() != kFieldCount) {
    if (err) {
      *err = "Parsed line has " + std::to_string(fields.size()) +
             " tokens instead of " + std::to_string(kFieldCount) + ".";
    }
    return LineError::FieldCount;
  }
  return LineError::None;
}

} // namespace clfstat
