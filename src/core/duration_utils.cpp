// Implementation of duration computation.

#include "core/duration_utils.h"

#include <cmath>

namespace playmml {

double dotMultiplier(int dots) {
  switch (dots) {
    case 0:  return 1.0;
    case 1:  return 1.5;
    default: return 1.75;
  }
}

double computeDurationMs(int tempo, int note_length, double dot_multiplier,
                         double articulation) {
  double value = (60.0 / tempo) * 1000.0;  // Milliseconds per quarter note
  value *= 4.0 / note_length;              // Quarter notes spanned by this length
  value *= dot_multiplier;
  value *= articulation;
  return value;
}

int roundDurationMs(double duration_ms) {
  return static_cast<int>(std::lround(duration_ms));
}

}  // namespace playmml
