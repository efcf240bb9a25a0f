// Tests for midi/midi_writer.h -- SMF Type 1 MIDI output.

#include "midi/midi_writer.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "midi/midi_stream.h"

namespace playmml {
namespace {

// ---------------------------------------------------------------------------
// Helper: create a Track with a single note for reuse across tests.
// ---------------------------------------------------------------------------

Track makeSimpleTrack(uint8_t program, const std::string& name, uint8_t pitch, Tick start,
                      Tick duration) {
  Track track;
  track.channel = 0;
  track.program = program;
  track.name = name;

  NoteEvent note;
  note.pitch = pitch;
  note.start_tick = start;
  note.duration = duration;
  track.notes.push_back(note);

  return track;
}

/// Offset of the first byte after the conductor MTrk chunk.
size_t afterConductor(const std::vector<uint8_t>& bytes) {
  return 22 + readBE32(bytes.data(), 18);
}

// ---------------------------------------------------------------------------
// Header
// ---------------------------------------------------------------------------

TEST(MidiWriterTest, DefaultConstructionProducesEmptyData) {
  MidiWriter writer;
  EXPECT_TRUE(writer.toBytes().empty());
}

TEST(MidiWriterTest, HeaderFields) {
  MidiWriter writer;
  writer.build({makeSimpleTrack(80, "PLAY", 60, 0, 480)}, {{0, 120}});
  const auto& bytes = writer.toBytes();
  ASSERT_GE(bytes.size(), 14u);

  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "MThd");
  EXPECT_EQ(readBE32(bytes.data(), 4), 6u);
  EXPECT_EQ(readBE16(bytes.data(), 8), 1u);   // Format 1
  EXPECT_EQ(readBE16(bytes.data(), 10), 2u);  // Conductor + one note track
  EXPECT_EQ(readBE16(bytes.data(), 12), 480u);
}

TEST(MidiWriterTest, EmptyTracksAreSkipped) {
  MidiWriter writer;
  Track empty;
  writer.build({empty, makeSimpleTrack(80, "PLAY", 60, 0, 480), empty}, {{0, 120}});
  EXPECT_EQ(readBE16(writer.toBytes().data(), 10), 2u);

  writer.build({}, {});
  EXPECT_EQ(readBE16(writer.toBytes().data(), 10), 1u);
}

// ---------------------------------------------------------------------------
// Conductor track
// ---------------------------------------------------------------------------

TEST(MidiWriterTest, ConductorTrackContents) {
  MidiWriter writer;
  writer.build({}, {{0, 120}}, "playmml");
  const auto& bytes = writer.toBytes();

  EXPECT_EQ(std::string(bytes.begin() + 14, bytes.begin() + 18), "MTrk");
  const std::vector<uint8_t> expected = {
      0x00, 0xFF, 0x03, 0x07, 'p',  'l',  'a',  'y',  'm',  'm',
      'l',                                                          // Track name
      0x00, 0xFF, 0x51, 0x03, 0x07, 0xA1, 0x20,                     // 500000 us
      0x00, 0xFF, 0x58, 0x04, 0x04, 0x02, 0x18, 0x08,               // 4/4
      0x00, 0xFF, 0x2F, 0x00};                                      // End of Track
  ASSERT_EQ(readBE32(bytes.data(), 18), expected.size());
  std::vector<uint8_t> body(bytes.begin() + 22, bytes.begin() + 22 + expected.size());
  EXPECT_EQ(body, expected);
  EXPECT_EQ(bytes.size(), 22 + expected.size());
}

TEST(MidiWriterTest, EmptyTempoMapFallsBackTo120) {
  MidiWriter fallback;
  fallback.build({}, {});
  MidiWriter explicit_tempo;
  explicit_tempo.build({}, {{0, 120}});
  EXPECT_EQ(fallback.toBytes(), explicit_tempo.toBytes());
}

TEST(MidiWriterTest, DifferentBpmProducesDifferentOutput) {
  MidiWriter slow;
  slow.build({}, {{0, 60}});
  MidiWriter fast;
  fast.build({}, {{0, 120}});
  EXPECT_NE(slow.toBytes(), fast.toBytes());
}

// ---------------------------------------------------------------------------
// Note track
// ---------------------------------------------------------------------------

TEST(MidiWriterTest, NoteTrackContents) {
  MidiWriter writer;
  writer.build({makeSimpleTrack(80, "PLAY", 60, 0, 480)}, {{0, 120}});
  const auto& bytes = writer.toBytes();
  size_t offset = afterConductor(bytes);

  ASSERT_GE(bytes.size(), offset + 8);
  EXPECT_EQ(std::string(bytes.begin() + offset, bytes.begin() + offset + 4), "MTrk");
  const std::vector<uint8_t> expected = {
      0x00, 0xC0, 0x50,                            // Program change 80
      0x00, 0xFF, 0x03, 0x04, 'P', 'L', 'A', 'Y',  // Track name
      0x00, 0x90, 0x3C, 0x64,                      // Note on
      0x83, 0x60, 0x80, 0x3C, 0x00,                // Note off after 480 ticks
      0x00, 0xFF, 0x2F, 0x00};
  ASSERT_EQ(readBE32(bytes.data(), offset + 4), expected.size());
  std::vector<uint8_t> body(bytes.begin() + offset + 8, bytes.end());
  EXPECT_EQ(body, expected);
}

TEST(MidiWriterTest, NoteOffPrecedesNoteOnAtSameTick) {
  Track track = makeSimpleTrack(80, "", 60, 0, 480);
  NoteEvent second;
  second.pitch = 62;
  second.start_tick = 480;
  second.duration = 240;
  track.notes.push_back(second);

  MidiWriter writer;
  writer.build({track}, {{0, 120}});
  const auto& bytes = writer.toBytes();
  size_t offset = afterConductor(bytes) + 8;

  // Program change, then on(60), off(60) at 480, on(62) at delta 0.
  const std::vector<uint8_t> expected = {
      0x00, 0xC0, 0x50,
      0x00, 0x90, 0x3C, 0x64,
      0x83, 0x60, 0x80, 0x3C, 0x00,
      0x00, 0x90, 0x3E, 0x64,
      0x81, 0x70, 0x80, 0x3E, 0x00,
      0x00, 0xFF, 0x2F, 0x00};
  std::vector<uint8_t> body(bytes.begin() + offset, bytes.end());
  EXPECT_EQ(body, expected);
}

TEST(MidiWriterTest, ConsecutiveBuildsOverwritePreviousData) {
  MidiWriter writer;
  writer.build({makeSimpleTrack(80, "PLAY", 60, 0, 480)}, {{0, 120}});
  size_t first_size = writer.toBytes().size();
  writer.build({}, {{0, 120}});
  EXPECT_LT(writer.toBytes().size(), first_size);
}

// ---------------------------------------------------------------------------
// File output
// ---------------------------------------------------------------------------

TEST(MidiWriterTest, WriteToFileContentMatchesToBytes) {
  MidiWriter writer;
  writer.build({makeSimpleTrack(80, "PLAY", 69, 0, 240)}, {{0, 120}});

  std::string path = ::testing::TempDir() + "playmml_writer_test.mid";
  ASSERT_TRUE(writer.writeToFile(path));

  FILE* file = std::fopen(path.c_str(), "rb");
  ASSERT_NE(file, nullptr);
  std::vector<uint8_t> read_back(writer.toBytes().size() + 16);
  size_t read_count = std::fread(read_back.data(), 1, read_back.size(), file);
  std::fclose(file);
  std::remove(path.c_str());

  read_back.resize(read_count);
  EXPECT_EQ(read_back, writer.toBytes());
}

TEST(MidiWriterTest, WriteToFileFailsForInvalidPath) {
  MidiWriter writer;
  writer.build({}, {{0, 120}});
  EXPECT_FALSE(writer.writeToFile("/nonexistent_dir/sub/out.mid"));
}

}  // namespace
}  // namespace playmml
