// Sink that records every event with its start time.

#ifndef PLAYMML_PLAYER_RECORDING_SINK_H
#define PLAYMML_PLAYER_RECORDING_SINK_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/basic_types.h"
#include "player/play_sink.h"

namespace playmml {

/// @brief Records the event stream instead of rendering it.
///
/// Start times accumulate the durations of all previous events, so
/// `start_ms` of event N equals the sum of durations of events 0..N-1.
class RecordingSink : public IPlaySink {
 public:
  RecordingSink() = default;

  void sound(int frequency_hz, int duration_ms) override;
  void pause(int duration_ms) override;

  const std::vector<PlayEvent>& events() const { return events_; }

  /// @brief Sum of all recorded durations.
  uint32_t totalDurationMs() const { return elapsed_ms_; }

  size_t toneCount() const;
  size_t pauseCount() const;

  /// @brief Forget all recorded events.
  void clear();

 private:
  std::vector<PlayEvent> events_;
  uint32_t elapsed_ms_ = 0;

  void record(EventKind kind, int frequency_hz, int duration_ms);
};

}  // namespace playmml

#endif  // PLAYMML_PLAYER_RECORDING_SINK_H
