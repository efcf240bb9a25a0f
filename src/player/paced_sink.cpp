/// @file
/// @brief PacedSink implementation.

#include "player/paced_sink.h"

#include <chrono>
#include <thread>
#include <utility>

namespace playmml {

namespace {

void sleepFor(int duration_ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

}  // namespace

PacedSink::PacedSink(IPlaySink& inner, Sleeper sleeper)
    : inner_(inner), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = sleepFor;
  }
}

void PacedSink::sound(int frequency_hz, int duration_ms) {
  inner_.sound(frequency_hz, duration_ms);
  wait(duration_ms);
}

void PacedSink::pause(int duration_ms) {
  inner_.pause(duration_ms);
  wait(duration_ms);
}

void PacedSink::wait(int duration_ms) {
  if (duration_ms <= 0) return;
  sleeper_(duration_ms);
  waited_ms_ += duration_ms;
}

}  // namespace playmml
