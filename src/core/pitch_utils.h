// Pitch utilities for PLAY notation -- note letter mapping, accidentals,
// explicit note numbers, and equal-temperament frequency conversion.

#ifndef PLAYMML_CORE_PITCH_UTILS_H
#define PLAYMML_CORE_PITCH_UTILS_H

#include <cstdint>

#include "core/basic_types.h"

namespace playmml {

// ---------------------------------------------------------------------------
// Note letter table
// ---------------------------------------------------------------------------

/// Pitch index of each letter A-G within octave 0.
/// The octave starts at A, so C sits above A and B in the same octave.
constexpr int kNoteLetterPitch[7] = {1, 3, 4, 6, 8, 9, 11};

/// @brief Check whether a (case-normalized) character is a note letter A-G.
inline bool isNoteLetter(char letter) {
  return letter >= 'A' && letter <= 'G';
}

/// @brief Pitch index of a note letter within an octave.
/// @param letter Upper-case note letter A-G.
/// @return Offset from kNoteLetterPitch, or -1 for any other character.
int noteLetterOffset(char letter);

/// @brief Whether a sharp raises this letter.
///
/// B-C and E-F are adjacent semitones, so B# and E# stay on B and E.
bool letterAcceptsSharp(char letter);

/// @brief Whether a flat lowers this letter (C and F ignore flats).
bool letterAcceptsFlat(char letter);

/// @brief Base pitch index of a letter in a given octave (no accidentals).
/// @param letter Upper-case note letter A-G.
/// @param octave Octave 0-6.
PitchIndex letterToPitchIndex(char letter, int octave);

/// @brief Map an explicit `N` note number (0-84) to the pitch index space.
inline PitchIndex noteNumberToPitchIndex(int note_number) {
  return note_number + kNoteNumberOffset;
}

// ---------------------------------------------------------------------------
// Frequency conversion
// ---------------------------------------------------------------------------

/// @brief True if the pitch index renders as a tone rather than silence.
inline bool isAudiblePitch(PitchIndex pitch) {
  return pitch >= kLowestAudiblePitch;
}

/// @brief Equal-temperament frequency of a pitch index (unrounded).
/// @param pitch Pitch index; 49 = 440 Hz.
/// @return Frequency in hertz: 440 * 2^((pitch - 49) / 12).
double pitchIndexToFrequency(PitchIndex pitch);

/// @brief Frequency of a pitch index rounded half away from zero.
int pitchIndexToFrequencyHz(PitchIndex pitch);

/// @brief MIDI note number for a pitch index (index 49 = MIDI 69).
inline int pitchIndexToMidiNote(PitchIndex pitch) {
  return pitch + 20;
}

/// @brief Nearest MIDI note number for a frequency, clamped to 0-127.
/// @param frequency_hz Frequency in hertz (must be > 0).
/// @return MIDI note number; 0 for non-positive frequencies.
uint8_t frequencyToMidiNote(double frequency_hz);

}  // namespace playmml

#endif  // PLAYMML_CORE_PITCH_UTILS_H
