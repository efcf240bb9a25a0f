// Duration computation for PLAY notation: tempo, note length, dotted
// multipliers and articulation folded into milliseconds.

#ifndef PLAYMML_CORE_DURATION_UTILS_H
#define PLAYMML_CORE_DURATION_UTILS_H

#include "core/basic_types.h"

namespace playmml {

/// @brief Duration multiplier for a dot count.
/// @param dots Number of dots after a note (0-2).
/// @return 1.0, 1.5 or 1.75. Callers validate the count; anything above 2 returns 1.75.
double dotMultiplier(int dots);

/// @brief Unrounded duration of one event in milliseconds.
///
/// ms = (60 / tempo) * 1000 * (4 / note_length) * dot_multiplier * articulation
///
/// @param tempo Quarter notes per minute (32-255).
/// @param note_length Denominator of a whole note (1-64).
/// @param dot_multiplier Value from dotMultiplier().
/// @param articulation Articulation ratio (0.75, 0.875 or 1.0).
double computeDurationMs(int tempo, int note_length, double dot_multiplier,
                         double articulation);

/// @brief Round a duration half away from zero to whole milliseconds.
int roundDurationMs(double duration_ms);

}  // namespace playmml

#endif  // PLAYMML_CORE_DURATION_UTILS_H
