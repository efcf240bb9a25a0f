// Tests for parser/token_rules.h -- each rule in isolation, including
// error positions and cursor placement.

#include "parser/token_rules.h"

#include <gtest/gtest.h>

#include <string>

namespace playmml {
namespace {

// ---------------------------------------------------------------------------
// Octave
// ---------------------------------------------------------------------------

TEST(ParseOctaveTest, AcceptsZeroThroughSix) {
  for (int value = 0; value <= 6; ++value) {
    std::string text = "O" + std::to_string(value);
    PlayCursor cursor(text);
    int octave = 3;
    PlayError error;
    ASSERT_TRUE(parseOctave(cursor, octave, error)) << text;
    EXPECT_EQ(octave, value);
    EXPECT_EQ(cursor.index(), 1u);
  }
}

TEST(ParseOctaveTest, RejectsSevenThroughNine) {
  for (int value = 7; value <= 9; ++value) {
    std::string text = "O" + std::to_string(value);
    PlayCursor cursor(text);
    int octave = 3;
    PlayError error;
    EXPECT_FALSE(parseOctave(cursor, octave, error)) << text;
    EXPECT_EQ(error.code, PlayErrorCode::OctaveOutOfRange);
    EXPECT_EQ(error.position, 1u);
    EXPECT_EQ(octave, 3);
  }
}

TEST(ParseOctaveTest, NonDigitIsOutOfRange) {
  PlayCursor cursor("OX");
  int octave = 3;
  PlayError error;
  EXPECT_FALSE(parseOctave(cursor, octave, error));
  EXPECT_EQ(error.code, PlayErrorCode::OctaveOutOfRange);
  EXPECT_EQ(error.character, 'X');
  EXPECT_EQ(error.detail, "Octave must be between 0 and 6 (inclusive).");
}

TEST(ParseOctaveTest, MissingDigitIsEndOfInput) {
  PlayCursor cursor("O");
  int octave = 3;
  PlayError error;
  EXPECT_FALSE(parseOctave(cursor, octave, error));
  EXPECT_EQ(error.code, PlayErrorCode::UnexpectedEndOfInput);
  EXPECT_EQ(error.position, 1u);
}

TEST(StepOctaveTest, StepsWithinRange) {
  PlayCursor cursor(">");
  int octave = 3;
  PlayError error;
  ASSERT_TRUE(stepOctave(cursor, octave, 1, error));
  EXPECT_EQ(octave, 4);
  ASSERT_TRUE(stepOctave(cursor, octave, -1, error));
  EXPECT_EQ(octave, 3);
}

TEST(StepOctaveTest, RejectsLeavingRange) {
  PlayCursor up(">");
  int octave = 6;
  PlayError error;
  EXPECT_FALSE(stepOctave(up, octave, 1, error));
  EXPECT_EQ(error.code, PlayErrorCode::OctaveOutOfRange);
  EXPECT_EQ(error.detail, "Octave cannot go above 6.");
  EXPECT_EQ(octave, 6);

  PlayCursor down("<");
  octave = 0;
  EXPECT_FALSE(stepOctave(down, octave, -1, error));
  EXPECT_EQ(error.detail, "Octave cannot go below 0.");
  EXPECT_EQ(error.character, '<');
  EXPECT_EQ(octave, 0);
}

// ---------------------------------------------------------------------------
// Tempo
// ---------------------------------------------------------------------------

TEST(ParseTempoTest, AcceptsBounds) {
  for (int value : {32, 99, 120, 255}) {
    std::string text = "T" + std::to_string(value);
    PlayCursor cursor(text);
    int tempo = 120;
    PlayError error;
    ASSERT_TRUE(parseTempo(cursor, tempo, error)) << text;
    EXPECT_EQ(tempo, value);
    EXPECT_EQ(cursor.index(), text.size() - 1);
  }
}

TEST(ParseTempoTest, RejectsBelowMinimum) {
  PlayCursor cursor("T31");
  int tempo = 120;
  PlayError error;
  EXPECT_FALSE(parseTempo(cursor, tempo, error));
  EXPECT_EQ(error.code, PlayErrorCode::TempoOutOfRange);
  EXPECT_EQ(error.position, 2u);
  EXPECT_EQ(tempo, 120);
}

TEST(ParseTempoTest, RejectsLeadingZero) {
  PlayCursor cursor("T031");
  int tempo = 120;
  PlayError error;
  EXPECT_FALSE(parseTempo(cursor, tempo, error));
  EXPECT_EQ(error.code, PlayErrorCode::TempoOutOfRange);
  EXPECT_EQ(error.position, 1u);
  EXPECT_EQ(error.character, '0');
}

TEST(ParseTempoTest, RejectsAboveMaximum) {
  PlayCursor cursor("T256");
  int tempo = 120;
  PlayError error;
  EXPECT_FALSE(parseTempo(cursor, tempo, error));
  EXPECT_EQ(error.code, PlayErrorCode::TempoOutOfRange);
  EXPECT_EQ(error.position, 3u);
  EXPECT_EQ(error.character, '6');
}

TEST(ParseTempoTest, RequiresTwoDigits) {
  PlayCursor cursor("T9C");
  int tempo = 120;
  PlayError error;
  EXPECT_FALSE(parseTempo(cursor, tempo, error));
  EXPECT_EQ(error.code, PlayErrorCode::TempoOutOfRange);
  EXPECT_EQ(error.position, 1u);
}

TEST(ParseTempoTest, StopsAfterThreeDigits) {
  PlayCursor cursor("T1204");
  int tempo = 0;
  PlayError error;
  ASSERT_TRUE(parseTempo(cursor, tempo, error));
  EXPECT_EQ(tempo, 120);
  EXPECT_EQ(cursor.index(), 3u);
}

// ---------------------------------------------------------------------------
// Length, note number, dots
// ---------------------------------------------------------------------------

TEST(ParseNoteLengthTest, AcceptsOneThroughSixtyFour) {
  for (int value = 1; value <= 64; ++value) {
    std::string text = "L" + std::to_string(value);
    PlayCursor cursor(text);
    int length = 4;
    PlayError error;
    ASSERT_TRUE(parseNoteLength(cursor, length, error)) << text;
    EXPECT_EQ(length, value);
  }
}

TEST(ParseNoteLengthTest, RejectsZero) {
  PlayCursor cursor("L0");
  int length = 4;
  PlayError error;
  EXPECT_FALSE(parseNoteLength(cursor, length, error));
  EXPECT_EQ(error.code, PlayErrorCode::NoteLengthOutOfRange);
  EXPECT_EQ(error.position, 1u);
  EXPECT_EQ(length, 4);
}

TEST(ParseNoteLengthTest, RejectsSixtyFive) {
  PlayCursor cursor("L65");
  int length = 4;
  PlayError error;
  EXPECT_FALSE(parseNoteLength(cursor, length, error));
  EXPECT_EQ(error.code, PlayErrorCode::NoteLengthOutOfRange);
  EXPECT_EQ(error.position, 2u);
  EXPECT_EQ(error.detail, "Note length must be between 1 and 64 (inclusive).");
}

TEST(ParseNoteNumberTest, AcceptsZeroThroughEightyFour) {
  for (int value = 0; value <= 84; ++value) {
    std::string text = "N" + std::to_string(value);
    PlayCursor cursor(text);
    int number = -1;
    PlayError error;
    ASSERT_TRUE(parseNoteNumber(cursor, number, error)) << text;
    EXPECT_EQ(number, value);
  }
}

TEST(ParseNoteNumberTest, RejectsEightyFive) {
  PlayCursor cursor("N85");
  int number = -1;
  PlayError error;
  EXPECT_FALSE(parseNoteNumber(cursor, number, error));
  EXPECT_EQ(error.code, PlayErrorCode::NoteNumberOutOfRange);
  EXPECT_EQ(error.position, 2u);
  EXPECT_EQ(number, -1);
}

TEST(ParseDottedCountTest, CountsUpToTwo) {
  PlayCursor none("C");
  PlayCursor one("C.");
  PlayCursor two("C..");
  int dots = -1;
  PlayError error;
  ASSERT_TRUE(parseDottedCount(none, dots, error));
  EXPECT_EQ(dots, 0);
  ASSERT_TRUE(parseDottedCount(one, dots, error));
  EXPECT_EQ(dots, 1);
  EXPECT_EQ(one.index(), 1u);
  ASSERT_TRUE(parseDottedCount(two, dots, error));
  EXPECT_EQ(dots, 2);
  EXPECT_EQ(two.index(), 2u);
}

TEST(ParseDottedCountTest, RejectsThreeDots) {
  PlayCursor cursor("C...");
  int dots = 0;
  PlayError error;
  EXPECT_FALSE(parseDottedCount(cursor, dots, error));
  EXPECT_EQ(error.code, PlayErrorCode::InvalidDottedCount);
  EXPECT_EQ(error.position, 3u);
}

// ---------------------------------------------------------------------------
// Mode
// ---------------------------------------------------------------------------

TEST(ParseModeDirectiveTest, AllLetters) {
  struct Case {
    const char* text;
    ModeDirective expected;
  };
  const Case cases[] = {{"MB", ModeDirective::Background}, {"MF", ModeDirective::Foreground},
                        {"ML", ModeDirective::Legato},     {"MN", ModeDirective::Normal},
                        {"ms", ModeDirective::Staccato}};
  for (const auto& test_case : cases) {
    PlayCursor cursor(test_case.text);
    ModeDirective directive = ModeDirective::Normal;
    PlayError error;
    ASSERT_TRUE(parseModeDirective(cursor, directive, error)) << test_case.text;
    EXPECT_EQ(directive, test_case.expected) << test_case.text;
  }
}

TEST(ParseModeDirectiveTest, RejectsOtherLetters) {
  PlayCursor cursor("MX");
  ModeDirective directive = ModeDirective::Normal;
  PlayError error;
  EXPECT_FALSE(parseModeDirective(cursor, directive, error));
  EXPECT_EQ(error.code, PlayErrorCode::UnexpectedCharacter);
  EXPECT_EQ(error.position, 1u);
}

// ---------------------------------------------------------------------------
// Notes
// ---------------------------------------------------------------------------

TEST(ParseNoteLetterTest, PlainLetter) {
  PlayCursor cursor("C");
  ResolvedNote note;
  PlayError error;
  ASSERT_TRUE(parseNoteLetter(cursor, 'C', 3, note, error));
  EXPECT_EQ(note.pitch, 40);
  EXPECT_EQ(note.length_override, 0);
  EXPECT_EQ(note.dots, 0);
}

TEST(ParseNoteLetterTest, SharpAndFlat) {
  PlayError error;
  ResolvedNote note;

  PlayCursor sharp("C#");
  ASSERT_TRUE(parseNoteLetter(sharp, 'C', 3, note, error));
  EXPECT_EQ(note.pitch, 41);
  EXPECT_EQ(sharp.index(), 1u);

  PlayCursor plus("F+");
  ASSERT_TRUE(parseNoteLetter(plus, 'F', 3, note, error));
  EXPECT_EQ(note.pitch, 46);

  PlayCursor flat("B-");
  ASSERT_TRUE(parseNoteLetter(flat, 'B', 3, note, error));
  EXPECT_EQ(note.pitch, 38);
}

TEST(ParseNoteLetterTest, AccidentalWithoutSlotIsConsumedButIgnored) {
  PlayError error;
  ResolvedNote note;

  PlayCursor b_sharp("B#");
  ASSERT_TRUE(parseNoteLetter(b_sharp, 'B', 3, note, error));
  EXPECT_EQ(note.pitch, 39);
  EXPECT_EQ(b_sharp.index(), 1u);

  PlayCursor e_sharp("E+");
  ASSERT_TRUE(parseNoteLetter(e_sharp, 'E', 3, note, error));
  EXPECT_EQ(note.pitch, 44);

  PlayCursor c_flat("C-");
  ASSERT_TRUE(parseNoteLetter(c_flat, 'C', 3, note, error));
  EXPECT_EQ(note.pitch, 40);
  EXPECT_EQ(c_flat.index(), 1u);

  PlayCursor f_flat("F-");
  ASSERT_TRUE(parseNoteLetter(f_flat, 'F', 3, note, error));
  EXPECT_EQ(note.pitch, 45);
}

TEST(ParseNoteLetterTest, InlineLengthAndDots) {
  PlayCursor cursor("D#16..");
  ResolvedNote note;
  PlayError error;
  ASSERT_TRUE(parseNoteLetter(cursor, 'D', 4, note, error));
  EXPECT_EQ(note.pitch, 55);
  EXPECT_EQ(note.length_override, 16);
  EXPECT_EQ(note.dots, 2);
  EXPECT_EQ(cursor.index(), 5u);
}

TEST(ParseNoteLetterTest, BadInlineLengthLeavesNoteUntouched) {
  PlayCursor cursor("C0");
  ResolvedNote note;
  note.pitch = 99;
  PlayError error;
  EXPECT_FALSE(parseNoteLetter(cursor, 'C', 3, note, error));
  EXPECT_EQ(error.code, PlayErrorCode::NoteLengthOutOfRange);
  EXPECT_EQ(note.pitch, 99);
}

TEST(ParseNoteNumberTokenTest, ResolvesPitchAndDots) {
  PlayCursor cursor("N44.");
  ResolvedNote note;
  PlayError error;
  ASSERT_TRUE(parseNoteNumberToken(cursor, note, error));
  EXPECT_EQ(note.pitch, 49);
  EXPECT_EQ(note.dots, 1);
  EXPECT_EQ(note.length_override, 0);
}

TEST(ParseNoteNumberTokenTest, ZeroIsAPause) {
  PlayCursor cursor("N0");
  ResolvedNote note;
  PlayError error;
  ASSERT_TRUE(parseNoteNumberToken(cursor, note, error));
  EXPECT_TRUE(note.isPause());
}

TEST(ParsePauseTokenTest, LengthIsMandatory) {
  PlayCursor ok("P8.");
  ResolvedNote note;
  PlayError error;
  ASSERT_TRUE(parsePauseToken(ok, note, error));
  EXPECT_TRUE(note.isPause());
  EXPECT_EQ(note.length_override, 8);
  EXPECT_EQ(note.dots, 1);

  PlayCursor missing("P");
  EXPECT_FALSE(parsePauseToken(missing, note, error));
  EXPECT_EQ(error.code, PlayErrorCode::UnexpectedEndOfInput);

  PlayCursor not_digit("PC");
  EXPECT_FALSE(parsePauseToken(not_digit, note, error));
  EXPECT_EQ(error.code, PlayErrorCode::NoteLengthOutOfRange);
  EXPECT_EQ(error.position, 1u);
}

TEST(WhitespaceTest, IgnorableCharacters) {
  for (char chr : {' ', '\t', '\n', '\v', '\f', '\r'}) {
    EXPECT_TRUE(isIgnorableWhitespace(chr)) << static_cast<int>(chr);
  }
  EXPECT_FALSE(isIgnorableWhitespace(','));
  EXPECT_FALSE(isIgnorableWhitespace('\0'));
}

}  // namespace
}  // namespace playmml
