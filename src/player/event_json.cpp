/// @file
/// @brief Events JSON builder.

#include "player/event_json.h"

#include "core/json_helpers.h"

namespace playmml {

std::string buildEventsJson(const std::vector<PlayEvent>& events) {
  JsonWriter writer;
  writer.beginArray();
  for (const auto& evt : events) {
    writer.beginObject();
    writer.key("type");
    writer.value(eventKindToString(evt.kind));
    if (evt.isTone()) {
      writer.key("frequency_hz");
      writer.value(evt.frequency_hz);
    }
    writer.key("duration_ms");
    writer.value(evt.duration_ms);
    writer.key("start_ms");
    writer.value(evt.start_ms);
    writer.endObject();
  }
  writer.endArray();
  return writer.toString();
}

}  // namespace playmml
