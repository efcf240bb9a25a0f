/// @file
/// @brief Event resolution and emission.

#include "player/event_emitter.h"

#include "core/duration_utils.h"
#include "core/pitch_utils.h"

namespace playmml {

PlayEvent resolveEvent(const ResolvedNote& note, const InterpreterState& state) {
  double duration = computeDurationMs(state.tempo, state.effectiveNoteLength(note),
                                      dotMultiplier(note.dots),
                                      articulationModifier(state.articulation));

  PlayEvent evt;
  evt.duration_ms = roundDurationMs(duration);
  if (note.isPause()) {
    evt.kind = EventKind::Silence;
    evt.frequency_hz = 0;
  } else {
    evt.kind = EventKind::Tone;
    evt.frequency_hz = pitchIndexToFrequencyHz(note.pitch);
  }
  return evt;
}

PlayEvent EventEmitter::emit(const ResolvedNote& note, const InterpreterState& state) {
  PlayEvent evt = resolveEvent(note, state);
  if (evt.isTone()) {
    sink_.sound(evt.frequency_hz, evt.duration_ms);
  } else {
    sink_.pause(evt.duration_ms);
  }
  ++emitted_count_;
  return evt;
}

}  // namespace playmml
