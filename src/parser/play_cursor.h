// Bounded, case-normalizing cursor over PLAY notation text.

#ifndef PLAYMML_PARSER_PLAY_CURSOR_H
#define PLAYMML_PARSER_PLAY_CURSOR_H

#include <cstddef>
#include <string_view>

#include "core/play_error.h"

namespace playmml {

/// @brief Index-based reader over borrowed notation text.
///
/// Every character handed out is upper-cased. Mandatory reads (current(),
/// advanceAndRead()) past the end fail with UnexpectedEndOfInput; call
/// getError() for the diagnostic. Lookahead (peekNext()) never fails and
/// never moves the cursor.
///
/// The text must outlive the cursor.
class PlayCursor {
 public:
  explicit PlayCursor(std::string_view text) : text_(text) {}

  /// @brief Read the character at the current index.
  /// @param chr Receives the upper-cased character on success.
  /// @return False if the index is at or past the end of the text.
  bool current(char& chr);

  /// @brief Move one character forward, then read as current().
  bool advanceAndRead(char& chr);

  /// @brief Look at the character after the current index.
  /// @return Upper-cased character, or '\0' past the end of the text.
  char peekNext() const;

  /// @brief True if the peeked character is a decimal digit.
  bool nextIsDigit() const;

  /// @brief Commit a lookahead by moving one character forward.
  void advance() { ++index_; }

  size_t index() const { return index_; }
  size_t size() const { return text_.size(); }
  bool atEnd() const { return index_ >= text_.size(); }

  /// @brief Diagnostic of the last failed read.
  const PlayError& getError() const { return error_; }

  /// @brief Upper-case a single character (ASCII letters only).
  static char normalize(char chr);

  /// @brief True for '0'-'9'.
  static bool isDigit(char chr) { return chr >= '0' && chr <= '9'; }

 private:
  std::string_view text_;
  size_t index_ = 0;
  PlayError error_;
};

}  // namespace playmml

#endif  // PLAYMML_PARSER_PLAY_CURSOR_H
