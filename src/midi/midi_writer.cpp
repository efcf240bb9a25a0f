/// @file
/// @brief SMF Type 1 MIDI file writer implementation.

#include "midi/midi_writer.h"

#include <algorithm>
#include <cstdio>

#include "midi/midi_stream.h"

namespace playmml {

namespace {

/// @brief Channel event ready for sorting before writing.
struct WriteEvent {
  Tick tick = 0;
  uint8_t status = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
  int priority = 0;  // Lower = earlier at same tick (note-off before note-on)
};

/// @brief Append a meta event carrying a text payload (FF type len text).
void appendTextMeta(std::vector<uint8_t>& buf, uint8_t type, const std::string& text) {
  writeVariableLength(buf, 0);
  buf.push_back(0xFF);
  buf.push_back(type);
  writeVariableLength(buf, static_cast<uint32_t>(text.size()));
  buf.insert(buf.end(), text.begin(), text.end());
}

}  // namespace

void MidiWriter::build(const std::vector<Track>& tracks,
                       const std::vector<TempoEvent>& tempo_events,
                       const std::string& title) {
  data_.clear();

  uint16_t note_tracks = static_cast<uint16_t>(
      std::count_if(tracks.begin(), tracks.end(),
                    [](const Track& track) { return !track.notes.empty(); }));

  writeHeader(static_cast<uint16_t>(note_tracks + 1), static_cast<uint16_t>(kTicksPerBeat));
  writeConductorTrack(tempo_events, title);

  for (const auto& track : tracks) {
    if (!track.notes.empty()) {
      writeNoteTrack(track);
    }
  }
}

bool MidiWriter::writeToFile(const std::string& path) const {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    return false;
  }
  size_t written = std::fwrite(data_.data(), 1, data_.size(), file);
  bool closed = std::fclose(file) == 0;
  return closed && written == data_.size();
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  const char magic[] = {'M', 'T', 'h', 'd'};
  data_.insert(data_.end(), magic, magic + 4);
  writeBE32(data_, 6);  // Header length
  writeBE16(data_, 1);  // Format 1 (multi-track)
  writeBE16(data_, num_tracks);
  writeBE16(data_, division);
}

void MidiWriter::writeConductorTrack(const std::vector<TempoEvent>& tempo_events,
                                     const std::string& title) {
  std::vector<uint8_t> track_buf;
  appendTextMeta(track_buf, 0x03, title);  // Track Name

  std::vector<TempoEvent> sorted_events = tempo_events;
  std::stable_sort(sorted_events.begin(), sorted_events.end(),
                   [](const TempoEvent& lhs, const TempoEvent& rhs) {
                     return lhs.tick < rhs.tick;
                   });
  if (sorted_events.empty()) {
    sorted_events.push_back({0, 120});
  }

  // Set Tempo: FF 51 03 tt tt tt (microseconds per quarter note)
  Tick prev_tick = 0;
  for (const auto& evt : sorted_events) {
    uint16_t bpm = evt.bpm > 0 ? evt.bpm : 120;
    uint32_t usec_per_beat = kMicrosecondsPerMinute / bpm;
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(0xFF);
    track_buf.push_back(0x51);
    track_buf.push_back(0x03);
    track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 16) & 0xFF));
    track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 8) & 0xFF));
    track_buf.push_back(static_cast<uint8_t>(usec_per_beat & 0xFF));
    prev_tick = evt.tick;
  }

  // Time Signature 4/4: FF 58 04 nn dd cc bb
  writeVariableLength(track_buf, 0);
  const uint8_t time_sig[] = {0xFF, 0x58, 0x04, 0x04, 0x02, 0x18, 0x08};
  track_buf.insert(track_buf.end(), time_sig, time_sig + sizeof(time_sig));

  appendTrackChunk(track_buf);
}

void MidiWriter::writeNoteTrack(const Track& track) {
  std::vector<uint8_t> track_buf;
  uint8_t channel = track.channel & 0x0F;

  // Program change at tick 0
  writeVariableLength(track_buf, 0);
  track_buf.push_back(static_cast<uint8_t>(0xC0 | channel));
  track_buf.push_back(track.program & 0x7F);

  if (!track.name.empty()) {
    appendTextMeta(track_buf, 0x03, track.name);
  }

  std::vector<WriteEvent> events;
  events.reserve(track.notes.size() * 2);
  for (const auto& note : track.notes) {
    WriteEvent on_event;
    on_event.tick = note.start_tick;
    on_event.status = static_cast<uint8_t>(0x90 | channel);
    on_event.data1 = note.pitch;
    on_event.data2 = note.velocity;
    on_event.priority = 1;
    events.push_back(on_event);

    WriteEvent off_event;
    off_event.tick = note.start_tick + note.duration;
    off_event.status = static_cast<uint8_t>(0x80 | channel);
    off_event.data1 = note.pitch;
    off_event.data2 = 0;
    off_event.priority = 0;
    events.push_back(off_event);
  }

  std::stable_sort(events.begin(), events.end(),
                   [](const WriteEvent& lhs, const WriteEvent& rhs) {
                     if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
                     return lhs.priority < rhs.priority;
                   });

  Tick prev_tick = 0;
  for (const auto& evt : events) {
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(evt.status);
    track_buf.push_back(evt.data1 & 0x7F);
    track_buf.push_back(evt.data2 & 0x7F);
    prev_tick = evt.tick;
  }

  appendTrackChunk(track_buf);
}

void MidiWriter::appendTrackChunk(std::vector<uint8_t>& track_buf) {
  // End of Track
  writeVariableLength(track_buf, 0);
  track_buf.push_back(0xFF);
  track_buf.push_back(0x2F);
  track_buf.push_back(0x00);

  const char magic[] = {'M', 'T', 'r', 'k'};
  data_.insert(data_.end(), magic, magic + 4);
  writeBE32(data_, static_cast<uint32_t>(track_buf.size()));
  data_.insert(data_.end(), track_buf.begin(), track_buf.end());
}

}  // namespace playmml
