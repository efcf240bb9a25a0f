// Sink that renders PLAY events into a Standard MIDI File.

#ifndef PLAYMML_MIDI_EXPORT_SINK_H
#define PLAYMML_MIDI_EXPORT_SINK_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/gm_program.h"
#include "player/play_sink.h"

namespace playmml {

/// Conductor tempo of exported files; 500 ms per quarter note.
constexpr uint16_t kExportBpm = 120;

/// @brief Convert milliseconds to ticks at kExportBpm (0.96 ticks per ms).
Tick msToExportTicks(int duration_ms);

/// @brief Collects events into a single note track for MIDI export.
///
/// Tones become notes at the nearest MIDI pitch; pauses only move the
/// write position forward.
class MidiExportSink : public IPlaySink {
 public:
  explicit MidiExportSink(uint8_t program = GmProgram::kSquareLead);

  void sound(int frequency_hz, int duration_ms) override;
  void pause(int duration_ms) override;

  const Track& track() const { return track_; }

  /// @brief Tick at which the next event will start.
  Tick currentTick() const { return current_tick_; }

  /// @brief Drop all collected notes and rewind to tick 0.
  void clear();

  /// @brief Serialize the collected track as SMF Type 1.
  std::vector<uint8_t> toBytes() const;

  /// @brief Write the SMF to disk.
  /// @return True on success.
  bool writeToFile(const std::string& path) const;

 private:
  Track track_;
  Tick current_tick_ = 0;
};

}  // namespace playmml

#endif  // PLAYMML_MIDI_EXPORT_SINK_H
