/// @file
/// @brief PLAY token rule implementations.

#include "parser/token_rules.h"

#include "core/pitch_utils.h"

namespace playmml {

namespace {

constexpr const char* kOctaveRangeDetail = "Octave must be between 0 and 6 (inclusive).";
constexpr const char* kOctaveBelowDetail = "Octave cannot go below 0.";
constexpr const char* kOctaveAboveDetail = "Octave cannot go above 6.";
constexpr const char* kNoteLengthDetail = "Note length must be between 1 and 64 (inclusive).";
constexpr const char* kNoteNumberDetail = "Note must be between 0 and 84 (inclusive).";
constexpr const char* kTempoDetail = "Tempo must be between 32 and 255 (inclusive).";
constexpr const char* kDottedDetail = "The dotted count must be between 0 and 2 (inclusive).";
constexpr const char* kUnexpectedDetail = "Unexpected character.";

/// @brief Advance and read, copying the cursor's diagnostic on failure.
bool readNext(PlayCursor& cursor, char& chr, PlayError& error) {
  if (!cursor.advanceAndRead(chr)) {
    error = cursor.getError();
    return false;
  }
  return true;
}

/// @brief Report `code` at the cursor's current character.
bool failAtCursor(const PlayCursor& cursor, PlayErrorCode code, const char* detail,
                  PlayError& error) {
  PlayCursor probe = cursor;
  char chr = '\0';
  if (!probe.current(chr)) {
    error = probe.getError();
    return false;
  }
  error = makePlayError(code, cursor.index(), chr, detail);
  return false;
}

/// @brief Numeric value of a digit; non-digits land outside 0-9.
int digitValue(char chr) {
  return static_cast<int>(chr) - static_cast<int>('0');
}

/// @brief Read a required digit and an optional second one.
/// @param first_min Smallest acceptable first digit.
/// @return False if the first character is not a digit >= first_min.
bool parseOneOrTwoDigits(PlayCursor& cursor, int first_min, int& value,
                         PlayErrorCode code, const char* detail, PlayError& error) {
  char chr = '\0';
  if (!readNext(cursor, chr, error)) return false;

  value = digitValue(chr);
  if (value < first_min || value > 9) {
    return failAtCursor(cursor, code, detail, error);
  }

  char next = cursor.peekNext();
  if (PlayCursor::isDigit(next)) {
    value = value * 10 + digitValue(next);
    cursor.advance();
  }
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Shared sub-rules
// ---------------------------------------------------------------------------

bool parseNoteLength(PlayCursor& cursor, int& note_length, PlayError& error) {
  int value = 0;
  if (!parseOneOrTwoDigits(cursor, 1, value, PlayErrorCode::NoteLengthOutOfRange,
                           kNoteLengthDetail, error)) {
    return false;
  }
  if (value < limits::kMinNoteLength || value > limits::kMaxNoteLength) {
    return failAtCursor(cursor, PlayErrorCode::NoteLengthOutOfRange, kNoteLengthDetail, error);
  }
  note_length = value;
  return true;
}

bool parseNoteNumber(PlayCursor& cursor, int& note_number, PlayError& error) {
  int value = 0;
  if (!parseOneOrTwoDigits(cursor, 0, value, PlayErrorCode::NoteNumberOutOfRange,
                           kNoteNumberDetail, error)) {
    return false;
  }
  if (value < limits::kMinNoteNumber || value > limits::kMaxNoteNumber) {
    return failAtCursor(cursor, PlayErrorCode::NoteNumberOutOfRange, kNoteNumberDetail, error);
  }
  note_number = value;
  return true;
}

bool parseDottedCount(PlayCursor& cursor, int& dots, PlayError& error) {
  int count = 0;
  while (cursor.peekNext() == '.') {
    ++count;
    cursor.advance();
  }
  if (count > limits::kMaxDots) {
    return failAtCursor(cursor, PlayErrorCode::InvalidDottedCount, kDottedDetail, error);
  }
  dots = count;
  return true;
}

// ---------------------------------------------------------------------------
// Directive rules
// ---------------------------------------------------------------------------

bool parseOctave(PlayCursor& cursor, int& octave, PlayError& error) {
  char chr = '\0';
  if (!readNext(cursor, chr, error)) return false;

  int value = digitValue(chr);
  if (value < limits::kMinOctave || value > limits::kMaxOctave) {
    return failAtCursor(cursor, PlayErrorCode::OctaveOutOfRange, kOctaveRangeDetail, error);
  }
  octave = value;
  return true;
}

bool stepOctave(const PlayCursor& cursor, int& octave, int delta, PlayError& error) {
  int value = octave + delta;
  if (value < limits::kMinOctave) {
    return failAtCursor(cursor, PlayErrorCode::OctaveOutOfRange, kOctaveBelowDetail, error);
  }
  if (value > limits::kMaxOctave) {
    return failAtCursor(cursor, PlayErrorCode::OctaveOutOfRange, kOctaveAboveDetail, error);
  }
  octave = value;
  return true;
}

bool parseTempo(PlayCursor& cursor, int& tempo, PlayError& error) {
  char chr = '\0';
  if (!readNext(cursor, chr, error)) return false;

  // Two digits are mandatory, the first one non-zero.
  int value = digitValue(chr);
  char next = cursor.peekNext();
  if (value < 1 || value > 9 || !PlayCursor::isDigit(next)) {
    return failAtCursor(cursor, PlayErrorCode::TempoOutOfRange, kTempoDetail, error);
  }
  value = value * 10 + digitValue(next);
  cursor.advance();

  next = cursor.peekNext();
  if (PlayCursor::isDigit(next)) {
    value = value * 10 + digitValue(next);
    cursor.advance();
  }

  if (value < limits::kMinTempo || value > limits::kMaxTempo) {
    return failAtCursor(cursor, PlayErrorCode::TempoOutOfRange, kTempoDetail, error);
  }
  tempo = value;
  return true;
}

bool parseModeDirective(PlayCursor& cursor, ModeDirective& directive, PlayError& error) {
  char chr = '\0';
  if (!readNext(cursor, chr, error)) return false;

  switch (chr) {
    case 'B': directive = ModeDirective::Background; return true;
    case 'F': directive = ModeDirective::Foreground; return true;
    case 'L': directive = ModeDirective::Legato; return true;
    case 'N': directive = ModeDirective::Normal; return true;
    case 'S': directive = ModeDirective::Staccato; return true;
    default:
      return failAtCursor(cursor, PlayErrorCode::UnexpectedCharacter, kUnexpectedDetail, error);
  }
}

// ---------------------------------------------------------------------------
// Note rules
// ---------------------------------------------------------------------------

bool parseNoteLetter(PlayCursor& cursor, char letter, int octave, ResolvedNote& note,
                     PlayError& error) {
  ResolvedNote resolved;
  resolved.pitch = letterToPitchIndex(letter, octave);

  // The accidental is consumed even where it has no pitch slot (B#, E#, C-, F-).
  char accidental = cursor.peekNext();
  if (accidental == '+' || accidental == '#') {
    if (letterAcceptsSharp(letter)) ++resolved.pitch;
    cursor.advance();
  } else if (accidental == '-') {
    if (letterAcceptsFlat(letter)) --resolved.pitch;
    cursor.advance();
  }

  if (cursor.nextIsDigit()) {
    if (!parseNoteLength(cursor, resolved.length_override, error)) return false;
  }
  if (!parseDottedCount(cursor, resolved.dots, error)) return false;

  note = resolved;
  return true;
}

bool parseNoteNumberToken(PlayCursor& cursor, ResolvedNote& note, PlayError& error) {
  int note_number = 0;
  if (!parseNoteNumber(cursor, note_number, error)) return false;

  ResolvedNote resolved;
  resolved.pitch = noteNumberToPitchIndex(note_number);
  if (!parseDottedCount(cursor, resolved.dots, error)) return false;

  note = resolved;
  return true;
}

bool parsePauseToken(PlayCursor& cursor, ResolvedNote& note, PlayError& error) {
  ResolvedNote resolved;
  resolved.pitch = kPauseSentinel;
  if (!parseNoteLength(cursor, resolved.length_override, error)) return false;
  if (!parseDottedCount(cursor, resolved.dots, error)) return false;

  note = resolved;
  return true;
}

bool isIgnorableWhitespace(char chr) {
  switch (chr) {
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case ' ':
      return true;
    default:
      return false;
  }
}

}  // namespace playmml
