// Implementation of pitch utility functions.

#include "core/pitch_utils.h"

#include <cmath>

namespace playmml {

int noteLetterOffset(char letter) {
  if (!isNoteLetter(letter)) return -1;
  return kNoteLetterPitch[letter - 'A'];
}

bool letterAcceptsSharp(char letter) {
  switch (letter) {
    case 'A':
    case 'C':
    case 'D':
    case 'F':
    case 'G':
      return true;
    default:
      return false;
  }
}

bool letterAcceptsFlat(char letter) {
  switch (letter) {
    case 'A':
    case 'B':
    case 'D':
    case 'E':
    case 'G':
      return true;
    default:
      return false;
  }
}

PitchIndex letterToPitchIndex(char letter, int octave) {
  return octave * 12 + noteLetterOffset(letter);
}

double pitchIndexToFrequency(PitchIndex pitch) {
  double semitones = static_cast<double>(pitch - kConcertAPitch);
  return kConcertAFrequency * std::pow(2.0, semitones / 12.0);
}

int pitchIndexToFrequencyHz(PitchIndex pitch) {
  return static_cast<int>(std::lround(pitchIndexToFrequency(pitch)));
}

uint8_t frequencyToMidiNote(double frequency_hz) {
  if (frequency_hz <= 0.0) return 0;
  // MIDI 69 = A 440 Hz.
  long note = std::lround(69.0 + 12.0 * std::log2(frequency_hz / kConcertAFrequency));
  if (note < 0) note = 0;
  if (note > 127) note = 127;
  return static_cast<uint8_t>(note);
}

}  // namespace playmml
