/// @file
/// @brief PLAY interpreter scan loop and token dispatch.

#include "play_interpreter.h"

#include <cstdio>

#include "core/basic_types.h"
#include "parser/play_cursor.h"
#include "parser/token_rules.h"
#include "player/event_emitter.h"

namespace playmml {

PlayInterpreter::PlayInterpreter() : sink_(&null_sink_) {}

PlayInterpreter::PlayInterpreter(IPlaySink& sink) : sink_(&sink) {}

bool PlayInterpreter::interpret(std::string_view text) {
  error_ = PlayError{};
  emitted_count_ = 0;

  InterpreterState state;
  PlayCursor cursor(text);
  EventEmitter emitter(*sink_);

  bool success = true;
  for (; !cursor.atEnd(); cursor.advance()) {
    char chr = '\0';
    if (!cursor.current(chr)) {
      error_ = cursor.getError();
      success = false;
      break;
    }
    if (!dispatch(chr, cursor, state, emitter)) {
      success = false;
      break;
    }
  }

  state_ = state;
  emitted_count_ = emitter.emittedCount();

  if (!success && verbose_) {
    std::fprintf(stderr, "[playmml] %s: %s\n", playErrorCodeToString(error_.code),
                 formatPlayError(error_).c_str());
  }
  return success;
}

bool PlayInterpreter::dispatch(char chr, PlayCursor& cursor, InterpreterState& state,
                               EventEmitter& emitter) {
  if (isIgnorableWhitespace(chr)) {
    return true;
  }

  ResolvedNote note;
  bool has_note = false;

  switch (chr) {
    case 'O':
      if (!parseOctave(cursor, state.octave, error_)) return false;
      if (verbose_) std::fprintf(stderr, "[playmml] octave %d\n", state.octave);
      break;

    case '<':
    case '>':
      if (!stepOctave(cursor, state.octave, chr == '<' ? -1 : 1, error_)) return false;
      if (verbose_) std::fprintf(stderr, "[playmml] octave %d\n", state.octave);
      break;

    case 'A':
    case 'B':
    case 'C':
    case 'D':
    case 'E':
    case 'F':
    case 'G':
      if (!parseNoteLetter(cursor, chr, state.octave, note, error_)) return false;
      has_note = true;
      break;

    case 'N':
      if (!parseNoteNumberToken(cursor, note, error_)) return false;
      has_note = true;
      break;

    case 'P':
      if (!parsePauseToken(cursor, note, error_)) return false;
      has_note = true;
      break;

    case 'L':
      if (!parseNoteLength(cursor, state.note_length, error_)) return false;
      if (verbose_) std::fprintf(stderr, "[playmml] length %d\n", state.note_length);
      break;

    case 'T':
      if (!parseTempo(cursor, state.tempo, error_)) return false;
      if (verbose_) std::fprintf(stderr, "[playmml] tempo %d\n", state.tempo);
      break;

    case 'M': {
      ModeDirective directive = ModeDirective::Normal;
      if (!parseModeDirective(cursor, directive, error_)) return false;
      applyModeDirective(state, directive);
      if (verbose_) {
        std::fprintf(stderr, "[playmml] mode %s\n", modeDirectiveToString(directive));
      }
      break;
    }

    default:
      return failUnexpected(chr, cursor);
  }

  if (has_note) {
    PlayEvent evt = emitter.emit(note, state);
    if (verbose_) {
      if (evt.isTone()) {
        std::fprintf(stderr, "[playmml] tone pitch=%d %d Hz %d ms\n", note.pitch,
                     evt.frequency_hz, evt.duration_ms);
      } else {
        std::fprintf(stderr, "[playmml] pause %d ms\n", evt.duration_ms);
      }
    }
  }
  return true;
}

bool PlayInterpreter::failUnexpected(char chr, const PlayCursor& cursor) {
  error_ = makePlayError(PlayErrorCode::UnexpectedCharacter, cursor.index(), chr,
                         "Unexpected character.");
  return false;
}

bool interpret(std::string_view text, IPlaySink& sink, PlayError* error) {
  PlayInterpreter interpreter(sink);
  bool success = interpreter.interpret(text);
  if (!success && error) {
    *error = interpreter.getError();
  }
  return success;
}

}  // namespace playmml
