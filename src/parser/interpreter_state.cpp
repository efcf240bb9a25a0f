// Implementation of articulation and mode helpers.

#include "parser/interpreter_state.h"

namespace playmml {

double articulationModifier(Articulation articulation) {
  switch (articulation) {
    case Articulation::Staccato: return 3.0 / 4.0;
    case Articulation::Normal:   return 7.0 / 8.0;
    case Articulation::Legato:   return 1.0;
  }
  return 7.0 / 8.0;
}

const char* articulationToString(Articulation articulation) {
  switch (articulation) {
    case Articulation::Staccato: return "Staccato";
    case Articulation::Normal:   return "Normal";
    case Articulation::Legato:   return "Legato";
  }
  return "Unknown";
}

const char* modeDirectiveToString(ModeDirective directive) {
  switch (directive) {
    case ModeDirective::Background: return "Background";
    case ModeDirective::Foreground: return "Foreground";
    case ModeDirective::Legato:     return "Legato";
    case ModeDirective::Normal:     return "Normal";
    case ModeDirective::Staccato:   return "Staccato";
  }
  return "Unknown";
}

void applyModeDirective(InterpreterState& state, ModeDirective directive) {
  switch (directive) {
    case ModeDirective::Background:
    case ModeDirective::Foreground:
      // Execution modes are accepted but not supported.
      break;
    case ModeDirective::Legato:
      state.articulation = Articulation::Legato;
      break;
    case ModeDirective::Normal:
      state.articulation = Articulation::Normal;
      break;
    case ModeDirective::Staccato:
      state.articulation = Articulation::Staccato;
      break;
  }
}

}  // namespace playmml
