/// @file
/// @brief MidiExportSink implementation.

#include "midi/midi_export_sink.h"

#include <cmath>

#include "core/pitch_utils.h"
#include "midi/midi_writer.h"

namespace playmml {

namespace {

/// @brief Build the single-track MIDI file for a collected track.
MidiWriter buildWriter(const Track& track) {
  MidiWriter writer;
  writer.build({track}, {{0, kExportBpm}});
  return writer;
}

}  // namespace

Tick msToExportTicks(int duration_ms) {
  if (duration_ms <= 0) return 0;
  constexpr double kMsPerBeat = 60000.0 / kExportBpm;
  return static_cast<Tick>(std::lround(duration_ms * kTicksPerBeat / kMsPerBeat));
}

MidiExportSink::MidiExportSink(uint8_t program) {
  track_.channel = 0;
  track_.program = program;
  track_.name = "PLAY";
}

void MidiExportSink::sound(int frequency_hz, int duration_ms) {
  Tick duration = msToExportTicks(duration_ms);
  if (duration > 0 && frequency_hz > 0) {
    NoteEvent note;
    note.start_tick = current_tick_;
    note.duration = duration;
    note.pitch = frequencyToMidiNote(static_cast<double>(frequency_hz));
    track_.notes.push_back(note);
  }
  current_tick_ += duration;
}

void MidiExportSink::pause(int duration_ms) {
  current_tick_ += msToExportTicks(duration_ms);
}

void MidiExportSink::clear() {
  track_.notes.clear();
  current_tick_ = 0;
}

std::vector<uint8_t> MidiExportSink::toBytes() const {
  return buildWriter(track_).toBytes();
}

bool MidiExportSink::writeToFile(const std::string& path) const {
  return buildWriter(track_).writeToFile(path);
}

}  // namespace playmml
