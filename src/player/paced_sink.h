// Decorator that realises event timing by blocking the calling thread.

#ifndef PLAYMML_PLAYER_PACED_SINK_H
#define PLAYMML_PLAYER_PACED_SINK_H

#include <functional>

#include "player/play_sink.h"

namespace playmml {

/// @brief Forwards events to an inner sink, then waits for their duration.
///
/// Used when the inner sink returns immediately (recorders, exporters) but
/// the host wants playback in real time. The sleeper is injectable so tests
/// can observe waits without sleeping.
class PacedSink : public IPlaySink {
 public:
  using Sleeper = std::function<void(int duration_ms)>;

  /// @param inner Sink receiving the events; must outlive this object.
  /// @param sleeper Wait function; defaults to std::this_thread::sleep_for.
  explicit PacedSink(IPlaySink& inner, Sleeper sleeper = Sleeper());

  void sound(int frequency_hz, int duration_ms) override;
  void pause(int duration_ms) override;

  /// @brief Total milliseconds handed to the sleeper so far.
  long long waitedMs() const { return waited_ms_; }

 private:
  IPlaySink& inner_;
  Sleeper sleeper_;
  long long waited_ms_ = 0;

  void wait(int duration_ms);
};

}  // namespace playmml

#endif  // PLAYMML_PLAYER_PACED_SINK_H
