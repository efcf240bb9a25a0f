// Basic types for PLAY notation interpretation

#ifndef PLAYMML_CORE_BASIC_TYPES_H
#define PLAYMML_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace playmml {

/// Absolute pitch index: 12 semitones per octave, index 49 = A (440 Hz).
using PitchIndex = int;

/// Tick type for MIDI export timing (absolute tick position).
using Tick = uint32_t;

/// Ticks per quarter note in exported MIDI files.
constexpr Tick kTicksPerBeat = 480;

// ---------------------------------------------------------------------------
// Notation ranges
// ---------------------------------------------------------------------------

namespace limits {

constexpr int kMinOctave = 0;
constexpr int kMaxOctave = 6;

constexpr int kMinTempo = 32;   // Quarter notes per minute
constexpr int kMaxTempo = 255;

constexpr int kMinNoteLength = 1;   // Whole note
constexpr int kMaxNoteLength = 64;  // 64th note

constexpr int kMinNoteNumber = 0;
constexpr int kMaxNoteNumber = 84;

constexpr int kMaxDots = 2;

}  // namespace limits

// ---------------------------------------------------------------------------
// Interpreter defaults
// ---------------------------------------------------------------------------

namespace defaults {

constexpr int kOctave = 3;
constexpr int kTempo = 120;
constexpr int kNoteLength = 4;

}  // namespace defaults

// ---------------------------------------------------------------------------
// Pitch index landmarks
// ---------------------------------------------------------------------------

/// Pitch value used by `P` pauses.
constexpr PitchIndex kPauseSentinel = 0;

/// Lowest pitch index rendered as a tone; anything below plays as silence.
constexpr PitchIndex kLowestAudiblePitch = 6;

/// Offset from an explicit `N` note number to its pitch index.
constexpr int kNoteNumberOffset = 5;

/// Pitch index of concert A.
constexpr PitchIndex kConcertAPitch = 49;
constexpr double kConcertAFrequency = 440.0;

// ---------------------------------------------------------------------------
// Resolved notes and events
// ---------------------------------------------------------------------------

/// @brief A note or pause as parsed from the notation, before timing is applied.
///
/// `length_override` is the inline note length written after the letter
/// (`C8`) or the mandatory length of a pause (`P8`); 0 means the interpreter's
/// default note length applies.
struct ResolvedNote {
  PitchIndex pitch = kPauseSentinel;
  int length_override = 0;
  int dots = 0;

  /// @brief True if this note renders as silence.
  bool isPause() const { return pitch < kLowestAudiblePitch; }
};

/// Kind of an externally observable event.
enum class EventKind : uint8_t {
  Tone,
  Silence
};

/// @brief Convert EventKind to its lowercase name ("tone" / "pause").
const char* eventKindToString(EventKind kind);

/// @brief A single rendered event, as handed to a sink.
struct PlayEvent {
  EventKind kind = EventKind::Silence;
  int frequency_hz = 0;   ///< 0 for silences.
  int duration_ms = 0;
  uint32_t start_ms = 0;  ///< Filled by recorders; the emitter leaves it at 0.

  bool isTone() const { return kind == EventKind::Tone; }
};

// ---------------------------------------------------------------------------
// MIDI export representation
// ---------------------------------------------------------------------------

/// A single note in an exported MIDI track.
struct NoteEvent {
  Tick start_tick = 0;
  Tick duration = 0;
  uint8_t pitch = 0;
  uint8_t velocity = 100;
};

/// Track: a collection of note events on a single MIDI channel.
struct Track {
  uint8_t channel = 0;
  uint8_t program = 0;  // GM program number
  std::string name;
  std::vector<NoteEvent> notes;
};

/// Tempo change event.
struct TempoEvent {
  Tick tick = 0;
  uint16_t bpm = 120;
};

}  // namespace playmml

#endif  // PLAYMML_CORE_BASIC_TYPES_H
