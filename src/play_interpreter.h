// Single-pass interpreter for PLAY notation.

#ifndef PLAYMML_PLAY_INTERPRETER_H
#define PLAYMML_PLAY_INTERPRETER_H

#include <cstddef>
#include <string>
#include <string_view>

#include "core/play_error.h"
#include "parser/interpreter_state.h"
#include "player/play_sink.h"

namespace playmml {

class PlayCursor;
class EventEmitter;

/// @brief Scans PLAY notation and emits events to a sink as it goes.
///
/// No token list is built: each token is parsed, applied to the state and,
/// for notes and pauses, rendered before the next character is read. Each
/// interpret() call starts from the default state (octave 3, tempo 120,
/// length 4, normal articulation).
///
/// The first error stops interpretation; events emitted before it have
/// already reached the sink.
class PlayInterpreter {
 public:
  /// @brief Interpreter writing to a no-op sink.
  PlayInterpreter();

  /// @param sink Event destination; must outlive the interpreter.
  explicit PlayInterpreter(IPlaySink& sink);

  PlayInterpreter(const PlayInterpreter&) = delete;
  PlayInterpreter& operator=(const PlayInterpreter&) = delete;

  /// @brief Interpret a notation string.
  /// @param text Notation, e.g. "T120 O3 MN L4 C D E".
  /// @return True on success. On failure, call getError() for details.
  bool interpret(std::string_view text);

  /// @brief Error of the last failed interpret() (code None after success).
  const PlayError& getError() const { return error_; }

  /// @brief formatPlayError() of the last error.
  std::string getErrorMessage() const { return formatPlayError(error_); }

  /// @brief State at the end of the last interpret() call (or at the failure).
  const InterpreterState& finalState() const { return state_; }

  /// @brief Number of events emitted by the last interpret() call.
  size_t emittedCount() const { return emitted_count_; }

  /// @brief Trace directives and events to stderr.
  void setVerbose(bool verbose) { verbose_ = verbose; }

 private:
  NullPlaySink null_sink_;
  IPlaySink* sink_;
  PlayError error_;
  InterpreterState state_;
  size_t emitted_count_ = 0;
  bool verbose_ = false;

  /// Handle the token whose leading character is under the cursor.
  bool dispatch(char chr, PlayCursor& cursor, InterpreterState& state, EventEmitter& emitter);

  /// Report a character that starts no token.
  bool failUnexpected(char chr, const PlayCursor& cursor);
};

/// @brief Interpret `text` into `sink` with a one-shot interpreter.
/// @param error Optional; receives the diagnostic on failure.
/// @return True on success.
bool interpret(std::string_view text, IPlaySink& sink, PlayError* error = nullptr);

}  // namespace playmml

#endif  // PLAYMML_PLAY_INTERPRETER_H
