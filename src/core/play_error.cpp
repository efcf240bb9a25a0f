/// @file
/// @brief Error naming and message formatting for PLAY interpretation.

#include "core/play_error.h"

namespace playmml {

const char* playErrorCodeToString(PlayErrorCode code) {
  switch (code) {
    case PlayErrorCode::None:                 return "none";
    case PlayErrorCode::UnexpectedEndOfInput: return "unexpected_end_of_input";
    case PlayErrorCode::UnexpectedCharacter:  return "unexpected_character";
    case PlayErrorCode::OctaveOutOfRange:     return "octave_out_of_range";
    case PlayErrorCode::NoteLengthOutOfRange: return "note_length_out_of_range";
    case PlayErrorCode::NoteNumberOutOfRange: return "note_number_out_of_range";
    case PlayErrorCode::TempoOutOfRange:      return "tempo_out_of_range";
    case PlayErrorCode::InvalidDottedCount:   return "invalid_dotted_count";
  }
  return "unknown";
}

PlayError makePlayError(PlayErrorCode code, size_t position, char character,
                        const std::string& detail) {
  PlayError error;
  error.code = code;
  error.position = position;
  error.character = character;
  error.has_character = true;
  error.detail = detail;
  return error;
}

PlayError makeEndOfInputError(size_t position) {
  PlayError error;
  error.code = PlayErrorCode::UnexpectedEndOfInput;
  error.position = position;
  error.detail = "Unexpected end of input.";
  return error;
}

std::string formatPlayError(const PlayError& error) {
  if (error.ok()) return "";

  if (!error.has_character) {
    return "Unexpected end of input at " + std::to_string(error.position) + ".";
  }

  std::string message = "Invalid token at " + std::to_string(error.position) + ": '";
  message += error.character;
  message += "'.";
  if (!error.detail.empty()) {
    message += ' ';
    message += error.detail;
  }
  return message;
}

}  // namespace playmml
