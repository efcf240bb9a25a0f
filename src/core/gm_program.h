// General MIDI program numbers used for MIDI export.

#ifndef PLAYMML_CORE_GM_PROGRAM_H
#define PLAYMML_CORE_GM_PROGRAM_H

#include <cstdint>

namespace playmml {

/// General MIDI program numbers (0-indexed as per MIDI specification).
/// Only the programs actually used in this project are defined here.
namespace GmProgram {

constexpr uint8_t kSquareLead = 80;   // Lead 1 (square), closest to a speaker beep

}  // namespace GmProgram

}  // namespace playmml

#endif  // PLAYMML_CORE_GM_PROGRAM_H
