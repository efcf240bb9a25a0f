// MIDI writer for rendered PLAY events. Writes SMF Type 1 files from Track objects.

#ifndef PLAYMML_MIDI_WRITER_H
#define PLAYMML_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace playmml {

/// @brief MIDI file writer that produces Standard MIDI File (SMF) Type 1 output.
///
/// The first track is a conductor track (name, tempo map, 4/4 time
/// signature); each non-empty Track follows as its own MTrk chunk.
class MidiWriter {
 public:
  MidiWriter() = default;

  /// @brief Build complete MIDI data from tracks.
  /// @param tracks Tracks to write; empty ones are skipped.
  /// @param tempo_events Tempo map. A 120 BPM event is used if empty.
  /// @param title Name of the conductor track.
  void build(const std::vector<Track>& tracks, const std::vector<TempoEvent>& tempo_events,
             const std::string& title = "playmml");

  /// @brief Get the binary MIDI data after build().
  const std::vector<uint8_t>& toBytes() const { return data_; }

  /// @brief Write built MIDI data to a file.
  /// @return True if the file was written completely.
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;

  void writeHeader(uint16_t num_tracks, uint16_t division);
  void writeConductorTrack(const std::vector<TempoEvent>& tempo_events, const std::string& title);
  void writeNoteTrack(const Track& track);

  /// Wrap a finished event buffer in an MTrk chunk (End of Track appended).
  void appendTrackChunk(std::vector<uint8_t>& track_buf);
};

}  // namespace playmml

#endif  // PLAYMML_MIDI_WRITER_H
