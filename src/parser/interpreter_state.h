// Mutable interpreter state threaded through the PLAY token rules.

#ifndef PLAYMML_PARSER_INTERPRETER_STATE_H
#define PLAYMML_PARSER_INTERPRETER_STATE_H

#include <cstdint>

#include "core/basic_types.h"

namespace playmml {

/// Note separation style, selected by `ML`, `MN` and `MS`.
enum class Articulation : uint8_t {
  Staccato,  ///< 3/4 of the note value sounds.
  Normal,    ///< 7/8 of the note value sounds.
  Legato     ///< Full note value.
};

/// @brief Duration ratio of an articulation (0.75, 0.875 or 1.0).
double articulationModifier(Articulation articulation);

/// @brief Convert Articulation to a human-readable string.
const char* articulationToString(Articulation articulation);

/// Letters accepted after `M`. Background and Foreground are accepted for
/// compatibility but do nothing.
enum class ModeDirective : uint8_t {
  Background,
  Foreground,
  Legato,
  Normal,
  Staccato
};

/// @brief Convert ModeDirective to a human-readable string.
const char* modeDirectiveToString(ModeDirective directive);

/// @brief State of one interpretation. Fresh per call, never shared.
struct InterpreterState {
  int octave = defaults::kOctave;            ///< 0-6
  int tempo = defaults::kTempo;              ///< 32-255 quarter notes per minute
  int note_length = defaults::kNoteLength;   ///< 1-64, denominator of a whole note
  Articulation articulation = Articulation::Normal;

  /// @brief Note length used by a note: its inline override, else the default.
  int effectiveNoteLength(const ResolvedNote& note) const {
    return note.length_override > 0 ? note.length_override : note_length;
  }
};

/// @brief Apply an `M` directive to the state (no-op for MB / MF).
void applyModeDirective(InterpreterState& state, ModeDirective directive);

}  // namespace playmml

#endif  // PLAYMML_PARSER_INTERPRETER_STATE_H
