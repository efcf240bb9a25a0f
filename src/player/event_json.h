// JSON listing of recorded PLAY events.

#ifndef PLAYMML_PLAYER_EVENT_JSON_H
#define PLAYMML_PLAYER_EVENT_JSON_H

#include <string>
#include <vector>

#include "core/basic_types.h"

namespace playmml {

/// @brief Build a JSON array describing each event.
///
/// Tones: {"type":"tone","frequency_hz":262,"duration_ms":438,"start_ms":0}
/// Pauses: {"type":"pause","duration_ms":438,"start_ms":438}
///
/// @param events Events in emission order (e.g. RecordingSink::events()).
/// @return Compact JSON string.
std::string buildEventsJson(const std::vector<PlayEvent>& events);

}  // namespace playmml

#endif  // PLAYMML_PLAYER_EVENT_JSON_H
