// Error taxonomy for PLAY notation interpretation, with source positions.

#ifndef PLAYMML_CORE_PLAY_ERROR_H
#define PLAYMML_CORE_PLAY_ERROR_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace playmml {

/// Reason an interpretation stopped.
enum class PlayErrorCode : uint8_t {
  None,
  UnexpectedEndOfInput,
  UnexpectedCharacter,
  OctaveOutOfRange,
  NoteLengthOutOfRange,
  NoteNumberOutOfRange,
  TempoOutOfRange,
  InvalidDottedCount
};

/// @brief Convert PlayErrorCode to a stable snake_case name.
const char* playErrorCodeToString(PlayErrorCode code);

/// @brief Diagnostic for the first failure of an interpretation.
struct PlayError {
  PlayErrorCode code = PlayErrorCode::None;
  size_t position = 0;         ///< Index into the input text.
  char character = '\0';       ///< Offending character (case-normalized).
  bool has_character = false;  ///< False when the position is past the end.
  std::string detail;          ///< Range or rule that was violated.

  bool ok() const { return code == PlayErrorCode::None; }
};

/// @brief Build an error located at a character of the input.
PlayError makePlayError(PlayErrorCode code, size_t position, char character,
                        const std::string& detail);

/// @brief Build an UnexpectedEndOfInput error at a position past the text.
PlayError makeEndOfInputError(size_t position);

/// @brief Human-readable message for an error.
/// @return "Invalid token at 3: 'X'. <detail>" when the character is known,
///         "Unexpected end of input at 3." otherwise, "" for PlayErrorCode::None.
std::string formatPlayError(const PlayError& error);

}  // namespace playmml

#endif  // PLAYMML_CORE_PLAY_ERROR_H
