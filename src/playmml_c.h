// C API for WASM and FFI bindings.

#ifndef PLAYMML_C_H
#define PLAYMML_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a PLAY interpreter instance.
typedef void* PlaymmlHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  PLAYMML_OK = 0,
  PLAYMML_ERROR_INVALID_PARAM = 1,
  PLAYMML_ERROR_UNEXPECTED_END_OF_INPUT = 2,
  PLAYMML_ERROR_UNEXPECTED_CHARACTER = 3,
  PLAYMML_ERROR_OCTAVE_OUT_OF_RANGE = 4,
  PLAYMML_ERROR_NOTE_LENGTH_OUT_OF_RANGE = 5,
  PLAYMML_ERROR_NOTE_NUMBER_OUT_OF_RANGE = 6,
  PLAYMML_ERROR_TEMPO_OUT_OF_RANGE = 7,
  PLAYMML_ERROR_INVALID_DOTTED_COUNT = 8,
} PlaymmlError;

/// @brief Tone callback: frequency in Hz, duration in ms.
typedef void (*PlaymmlSoundFn)(int frequency_hz, int duration_ms, void* user_data);

/// @brief Pause callback: duration in ms.
typedef void (*PlaymmlPauseFn)(int duration_ms, void* user_data);

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief MIDI binary output.
typedef struct {
  uint8_t* data;  ///< MIDI binary data
  size_t size;    ///< Size in bytes
} PlaymmlMidiData;

/// @brief Event JSON output.
typedef struct {
  char* json;     ///< JSON string (NUL-terminated)
  size_t length;  ///< String length
} PlaymmlEventData;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new interpreter instance.
/// @return Handle (must be freed with playmml_destroy)
PlaymmlHandle playmml_create(void);

/// @brief Destroy an interpreter instance.
void playmml_destroy(PlaymmlHandle handle);

/// @brief Install callbacks receiving each event as it is emitted.
/// Either callback may be NULL.
void playmml_set_sink(PlaymmlHandle handle, PlaymmlSoundFn sound, PlaymmlPauseFn pause,
                      void* user_data);

// ============================================================================
// Interpretation
// ============================================================================

/// @brief Interpret PLAY notation.
/// @param handle Instance handle
/// @param text Notation text (need not be NUL-terminated)
/// @param length Length of the text in bytes
/// @return PLAYMML_OK on success
PlaymmlError playmml_play(PlaymmlHandle handle, const char* text, size_t length);

/// @brief Index of the offending character of the last failed play.
size_t playmml_error_position(PlaymmlHandle handle);

/// @brief Diagnostic message of the last failed play ("" after success).
/// @return Message owned by the handle, valid until the next play.
const char* playmml_error_message(PlaymmlHandle handle);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get the events of the last play as JSON (up to the error, if any).
/// @return EventData (must be freed with playmml_free_events)
PlaymmlEventData* playmml_get_events(PlaymmlHandle handle);

/// @brief Free event data.
void playmml_free_events(PlaymmlEventData* data);

/// @brief Get the last successful play as SMF bytes.
/// @return MidiData (must be freed with playmml_free_midi), NULL if none
PlaymmlMidiData* playmml_get_midi(PlaymmlHandle handle);

/// @brief Free MIDI data.
void playmml_free_midi(PlaymmlMidiData* data);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get error message for error code.
/// @return Error message (static, do not free)
const char* playmml_error_string(PlaymmlError error);

/// @brief Get library version string.
const char* playmml_version(void);

#ifdef __cplusplus
}
#endif

#endif  // PLAYMML_C_H
