#pragma once

#include <string>
#include <vector>

#include "clfstat/types.hpp"

namespace clfstat {

// Shell-style word splitting (POSIX shlex rules):
// - words are separated by space, tab, CR and LF
// - "..." groups text; inside it a backslash only escapes '"' and '\'
// - '...' groups text literally
// - outside quotes a backslash escapes the next character
// - quoted and bare parts next to each other form one word
// Returns false and fills *err on an unbalanced quote or a trailing backslash.
bool split_words(const std::string& text,
                 std::vector<std::string>& out,
                 std::string* err = nullptr);

// Splits a CLF line into its kFieldCount fields.
// Returns LineError::Malformed or LineError::FieldCount on failure.
LineError tokenize_line(const std::string& line,
                        std::vector<std::string>& fields,
                        std::string* err = nullptr);

} // namespace clfstat
