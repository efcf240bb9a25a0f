// Implementation of C API for WASM and FFI bindings.

#include "playmml_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include "core/play_error.h"
#include "midi/midi_export_sink.h"
#include "play_interpreter.h"
#include "player/event_json.h"
#include "player/recording_sink.h"

namespace {

constexpr const char* kVersion = "0.1.0";

/// @brief Forwards every event to the recorder, the exporter and the
/// optional user callbacks.
class CallbackSink : public playmml::IPlaySink {
 public:
  CallbackSink(playmml::RecordingSink& recorder, playmml::MidiExportSink& midi)
      : recorder_(recorder), midi_(midi) {}

  void setCallbacks(PlaymmlSoundFn sound, PlaymmlPauseFn pause, void* user_data) {
    sound_fn_ = sound;
    pause_fn_ = pause;
    user_data_ = user_data;
  }

  void sound(int frequency_hz, int duration_ms) override {
    recorder_.sound(frequency_hz, duration_ms);
    midi_.sound(frequency_hz, duration_ms);
    if (sound_fn_) sound_fn_(frequency_hz, duration_ms, user_data_);
  }

  void pause(int duration_ms) override {
    recorder_.pause(duration_ms);
    midi_.pause(duration_ms);
    if (pause_fn_) pause_fn_(duration_ms, user_data_);
  }

 private:
  playmml::RecordingSink& recorder_;
  playmml::MidiExportSink& midi_;
  PlaymmlSoundFn sound_fn_ = nullptr;
  PlaymmlPauseFn pause_fn_ = nullptr;
  void* user_data_ = nullptr;
};

/// @brief Internal state held per PlaymmlHandle.
struct PlaymmlInstance {
  playmml::RecordingSink recorder;
  playmml::MidiExportSink midi;
  CallbackSink sink{recorder, midi};
  playmml::PlayError error;
  std::string error_message;
  std::vector<uint8_t> midi_bytes;
  bool has_result = false;
};

PlaymmlError toCError(playmml::PlayErrorCode code) {
  switch (code) {
    case playmml::PlayErrorCode::None:                 return PLAYMML_OK;
    case playmml::PlayErrorCode::UnexpectedEndOfInput: return PLAYMML_ERROR_UNEXPECTED_END_OF_INPUT;
    case playmml::PlayErrorCode::UnexpectedCharacter:  return PLAYMML_ERROR_UNEXPECTED_CHARACTER;
    case playmml::PlayErrorCode::OctaveOutOfRange:     return PLAYMML_ERROR_OCTAVE_OUT_OF_RANGE;
    case playmml::PlayErrorCode::NoteLengthOutOfRange: return PLAYMML_ERROR_NOTE_LENGTH_OUT_OF_RANGE;
    case playmml::PlayErrorCode::NoteNumberOutOfRange: return PLAYMML_ERROR_NOTE_NUMBER_OUT_OF_RANGE;
    case playmml::PlayErrorCode::TempoOutOfRange:      return PLAYMML_ERROR_TEMPO_OUT_OF_RANGE;
    case playmml::PlayErrorCode::InvalidDottedCount:   return PLAYMML_ERROR_INVALID_DOTTED_COUNT;
  }
  return PLAYMML_ERROR_INVALID_PARAM;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

PlaymmlHandle playmml_create(void) {
  return new PlaymmlInstance();
}

void playmml_destroy(PlaymmlHandle handle) {
  delete static_cast<PlaymmlInstance*>(handle);
}

void playmml_set_sink(PlaymmlHandle handle, PlaymmlSoundFn sound, PlaymmlPauseFn pause,
                      void* user_data) {
  if (!handle) return;
  static_cast<PlaymmlInstance*>(handle)->sink.setCallbacks(sound, pause, user_data);
}

// ============================================================================
// Interpretation
// ============================================================================

PlaymmlError playmml_play(PlaymmlHandle handle, const char* text, size_t length) {
  if (!handle || (!text && length > 0)) {
    return PLAYMML_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<PlaymmlInstance*>(handle);
  instance->recorder.clear();
  instance->midi.clear();
  instance->midi_bytes.clear();
  instance->has_result = false;

  playmml::PlayInterpreter interpreter(instance->sink);
  std::string_view notation = text ? std::string_view(text, length) : std::string_view();
  bool success = interpreter.interpret(notation);

  instance->error = interpreter.getError();
  instance->error_message = interpreter.getErrorMessage();
  if (!success) {
    return toCError(instance->error.code);
  }

  instance->midi_bytes = instance->midi.toBytes();
  instance->has_result = true;
  return PLAYMML_OK;
}

size_t playmml_error_position(PlaymmlHandle handle) {
  if (!handle) return 0;
  return static_cast<PlaymmlInstance*>(handle)->error.position;
}

const char* playmml_error_message(PlaymmlHandle handle) {
  if (!handle) return "";
  return static_cast<PlaymmlInstance*>(handle)->error_message.c_str();
}

// ============================================================================
// Output Retrieval
// ============================================================================

PlaymmlEventData* playmml_get_events(PlaymmlHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<PlaymmlInstance*>(handle);

  std::string json = playmml::buildEventsJson(instance->recorder.events());

  auto* result = static_cast<PlaymmlEventData*>(std::malloc(sizeof(PlaymmlEventData)));
  if (!result) return nullptr;
  result->length = json.size();
  result->json = static_cast<char*>(std::malloc(json.size() + 1));
  if (!result->json) {
    std::free(result);
    return nullptr;
  }
  std::memcpy(result->json, json.c_str(), json.size() + 1);
  return result;
}

void playmml_free_events(PlaymmlEventData* data) {
  if (data) {
    std::free(data->json);
    std::free(data);
  }
}

PlaymmlMidiData* playmml_get_midi(PlaymmlHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<PlaymmlInstance*>(handle);
  if (!instance->has_result || instance->midi_bytes.empty()) return nullptr;

  auto* result = static_cast<PlaymmlMidiData*>(std::malloc(sizeof(PlaymmlMidiData)));
  if (!result) return nullptr;
  result->size = instance->midi_bytes.size();
  result->data = static_cast<uint8_t*>(std::malloc(result->size));
  if (!result->data) {
    std::free(result);
    return nullptr;
  }
  std::memcpy(result->data, instance->midi_bytes.data(), result->size);
  return result;
}

void playmml_free_midi(PlaymmlMidiData* data) {
  if (data) {
    std::free(data->data);
    std::free(data);
  }
}

// ============================================================================
// Utilities
// ============================================================================

const char* playmml_error_string(PlaymmlError error) {
  switch (error) {
    case PLAYMML_OK:                             return "OK";
    case PLAYMML_ERROR_INVALID_PARAM:            return "Invalid parameter";
    case PLAYMML_ERROR_UNEXPECTED_END_OF_INPUT:  return "Unexpected end of input";
    case PLAYMML_ERROR_UNEXPECTED_CHARACTER:     return "Unexpected character";
    case PLAYMML_ERROR_OCTAVE_OUT_OF_RANGE:      return "Octave out of range (0-6)";
    case PLAYMML_ERROR_NOTE_LENGTH_OUT_OF_RANGE: return "Note length out of range (1-64)";
    case PLAYMML_ERROR_NOTE_NUMBER_OUT_OF_RANGE: return "Note number out of range (0-84)";
    case PLAYMML_ERROR_TEMPO_OUT_OF_RANGE:       return "Tempo out of range (32-255)";
    case PLAYMML_ERROR_INVALID_DOTTED_COUNT:     return "Too many dots (0-2)";
  }
  return "Unknown error";
}

const char* playmml_version(void) {
  return kVersion;
}

}  // extern "C"
