// Pure abstract interface for the output side of PLAY interpretation.
// Concrete implementations: NullPlaySink, RecordingSink, PacedSink,
// MidiExportSink, CallbackSink (C API).

#ifndef PLAYMML_PLAYER_PLAY_SINK_H
#define PLAYMML_PLAYER_PLAY_SINK_H

namespace playmml {

/// @brief Receiver of rendered events, one call per event, in order.
///
/// The interpreter calls sound() for every tone and pause() for every
/// silence. A device-backed sink is expected to block until the event's
/// duration has elapsed; recorders may return immediately.
class IPlaySink {
 public:
  virtual ~IPlaySink() = default;

  /// @brief Play a tone.
  /// @param frequency_hz Rounded frequency in hertz.
  /// @param duration_ms Rounded duration in milliseconds.
  virtual void sound(int frequency_hz, int duration_ms) = 0;

  /// @brief Stay silent.
  /// @param duration_ms Rounded duration in milliseconds.
  virtual void pause(int duration_ms) = 0;
};

/// @brief Sink used when no device is available. Never fails, does nothing.
class NullPlaySink : public IPlaySink {
 public:
  void sound(int /*frequency_hz*/, int /*duration_ms*/) override {}
  void pause(int /*duration_ms*/) override {}
};

}  // namespace playmml

#endif  // PLAYMML_PLAYER_PLAY_SINK_H
