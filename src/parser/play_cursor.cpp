/// @file
/// @brief PlayCursor implementation.

#include "parser/play_cursor.h"

#include <cctype>

namespace playmml {

bool PlayCursor::current(char& chr) {
  if (index_ >= text_.size()) {
    error_ = makeEndOfInputError(index_);
    return false;
  }
  chr = normalize(text_[index_]);
  return true;
}

bool PlayCursor::advanceAndRead(char& chr) {
  ++index_;
  return current(chr);
}

char PlayCursor::peekNext() const {
  size_t next = index_ + 1;
  if (next >= text_.size()) return '\0';
  return normalize(text_[next]);
}

bool PlayCursor::nextIsDigit() const {
  return isDigit(peekNext());
}

char PlayCursor::normalize(char chr) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(chr)));
}

}  // namespace playmml
