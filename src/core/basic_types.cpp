// Implementation of enum-to-string conversions.

#include "core/basic_types.h"

namespace playmml {

const char* eventKindToString(EventKind kind) {
  switch (kind) {
    case EventKind::Tone:    return "tone";
    case EventKind::Silence: return "pause";
  }
  return "unknown";
}

}  // namespace playmml
