// Per-token parsing rules for PLAY notation.
//
// Each rule is entered with the cursor on the token's leading character and
// leaves it on the last character it consumed, so the interpreter's scan can
// simply advance by one afterwards. Rules return false on the first violation
// and fill `error`; nothing is partially applied to the caller's values.

#ifndef PLAYMML_PARSER_TOKEN_RULES_H
#define PLAYMML_PARSER_TOKEN_RULES_H

#include "core/basic_types.h"
#include "core/play_error.h"
#include "parser/interpreter_state.h"
#include "parser/play_cursor.h"

namespace playmml {

// ---------------------------------------------------------------------------
// Shared sub-rules
// ---------------------------------------------------------------------------

/// @brief Parse a 1-2 digit note length (1-64) following the cursor.
/// @param cursor Cursor on the character before the digits.
/// @param note_length Receives the length on success.
/// @param error Receives NoteLengthOutOfRange or UnexpectedEndOfInput.
/// @return True on success.
bool parseNoteLength(PlayCursor& cursor, int& note_length, PlayError& error);

/// @brief Parse a 1-2 digit explicit note number (0-84) following the cursor.
/// @return True on success; NoteNumberOutOfRange otherwise.
bool parseNoteNumber(PlayCursor& cursor, int& note_number, PlayError& error);

/// @brief Consume up to two '.' characters following the cursor.
/// @param dots Receives the dot count (0-2).
/// @return False with InvalidDottedCount if three or more dots follow.
bool parseDottedCount(PlayCursor& cursor, int& dots, PlayError& error);

// ---------------------------------------------------------------------------
// Directive rules
// ---------------------------------------------------------------------------

/// @brief `O<digit>`: parse an absolute octave 0-6.
bool parseOctave(PlayCursor& cursor, int& octave, PlayError& error);

/// @brief `<` / `>`: step the octave by `delta`, rejecting results outside 0-6.
/// @param octave Current octave, updated only on success.
/// @param delta -1 for `<`, +1 for `>`.
bool stepOctave(const PlayCursor& cursor, int& octave, int delta, PlayError& error);

/// @brief `T<2-3 digits>`: parse a tempo 32-255.
bool parseTempo(PlayCursor& cursor, int& tempo, PlayError& error);

/// @brief `M<B|F|L|N|S>`: parse the mode letter.
/// @return False with UnexpectedCharacter for any other letter.
bool parseModeDirective(PlayCursor& cursor, ModeDirective& directive, PlayError& error);

// ---------------------------------------------------------------------------
// Note rules
// ---------------------------------------------------------------------------

/// @brief `A`-`G` with optional accidental, inline length and dots.
/// @param cursor Cursor on the letter.
/// @param letter Upper-case letter under the cursor.
/// @param octave Current octave.
/// @param note Receives the resolved note.
bool parseNoteLetter(PlayCursor& cursor, char letter, int octave, ResolvedNote& note,
                     PlayError& error);

/// @brief `N<0-84>` with optional dots.
bool parseNoteNumberToken(PlayCursor& cursor, ResolvedNote& note, PlayError& error);

/// @brief `P<1-64>` with optional dots. The length is mandatory.
bool parsePauseToken(PlayCursor& cursor, ResolvedNote& note, PlayError& error);

/// @brief Tab, newline, vertical tab, form feed, carriage return or space.
bool isIgnorableWhitespace(char chr);

}  // namespace playmml

#endif  // PLAYMML_PARSER_TOKEN_RULES_H
