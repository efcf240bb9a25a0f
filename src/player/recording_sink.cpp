/// @file
/// @brief RecordingSink implementation.

#include "player/recording_sink.h"

#include <algorithm>

namespace playmml {

void RecordingSink::sound(int frequency_hz, int duration_ms) {
  record(EventKind::Tone, frequency_hz, duration_ms);
}

void RecordingSink::pause(int duration_ms) {
  record(EventKind::Silence, 0, duration_ms);
}

size_t RecordingSink::toneCount() const {
  return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                           [](const PlayEvent& evt) { return evt.isTone(); }));
}

size_t RecordingSink::pauseCount() const {
  return events_.size() - toneCount();
}

void RecordingSink::clear() {
  events_.clear();
  elapsed_ms_ = 0;
}

void RecordingSink::record(EventKind kind, int frequency_hz, int duration_ms) {
  PlayEvent evt;
  evt.kind = kind;
  evt.frequency_hz = frequency_hz;
  evt.duration_ms = duration_ms;
  evt.start_ms = elapsed_ms_;
  events_.push_back(evt);

  if (duration_ms > 0) {
    elapsed_ms_ += static_cast<uint32_t>(duration_ms);
  }
}

}  // namespace playmml
