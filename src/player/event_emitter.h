// Converts resolved notes into timed events and forwards them to a sink.

#ifndef PLAYMML_PLAYER_EVENT_EMITTER_H
#define PLAYMML_PLAYER_EVENT_EMITTER_H

#include <cstddef>

#include "core/basic_types.h"
#include "parser/interpreter_state.h"
#include "player/play_sink.h"

namespace playmml {

/// @brief Compute the event for a note under the current state (pure).
///
/// Duration uses the note's inline length when present, otherwise the
/// state's default length. Notes below kLowestAudiblePitch become silences.
PlayEvent resolveEvent(const ResolvedNote& note, const InterpreterState& state);

/// @brief Emits one event per resolved note, in call order.
class EventEmitter {
 public:
  /// @param sink Destination; must outlive the emitter.
  explicit EventEmitter(IPlaySink& sink) : sink_(sink) {}

  /// @brief Resolve and forward a note.
  /// @return The event handed to the sink.
  PlayEvent emit(const ResolvedNote& note, const InterpreterState& state);

  size_t emittedCount() const { return emitted_count_; }

 private:
  IPlaySink& sink_;
  size_t emitted_count_ = 0;
};

}  // namespace playmml

#endif  // PLAYMML_PLAYER_EVENT_EMITTER_H
