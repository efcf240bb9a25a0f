/// @file
/// @brief CLI entry point for the PLAY notation interpreter.

#include <cstdio>
#include <cstring>
#include <string>

#include "core/play_error.h"
#include "midi/midi_export_sink.h"
#include "play_interpreter.h"
#include "player/event_json.h"
#include "player/paced_sink.h"
#include "player/recording_sink.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitPlayError = 1;
constexpr int kExitIoError = 2;

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string input_path;
  std::string text;
  bool has_text = false;
  std::string midi_output;
  bool json_output = false;
  bool realtime = false;
  bool verbose = false;
};

/// @brief Resolved settings for one run.
struct PlayerConfig {
  std::string input_path;  ///< Empty = use `text` or stdin.
  std::string text;
  bool read_stdin = false;
  std::string midi_output;  ///< Empty = no MIDI export.
  bool json_output = false;
  bool realtime = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("playmml_cli - PLAY notation interpreter\n\n");
  std::printf("Usage: playmml_cli [options] [\"notation\"]\n\n");
  std::printf("Options:\n");
  std::printf("  -f FILE          Read notation from FILE\n");
  std::printf("  -o FILE          Export the performance as a MIDI file\n");
  std::printf("  --json           Print events as JSON\n");
  std::printf("  --realtime       Wait out each event's duration while playing\n");
  std::printf("  --verbose        Trace directives and events to stderr\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nWithout -f or notation text, notation is read from stdin.\n");
  std::printf("\nExample:\n");
  std::printf("  playmml_cli \"T120 O3 MN L4 C D E F G\" -o scale.mid\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "-f") == 0 && idx + 1 < argc) {
      opts.input_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.midi_output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--realtime") == 0) {
      opts.realtime = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else if (argv[idx][0] == '-' && argv[idx][1] != '\0') {
      std::fprintf(stderr, "[playmml] ignoring unknown option: %s\n", argv[idx]);
    } else {
      if (opts.has_text) opts.text += ' ';
      opts.text += argv[idx];
      opts.has_text = true;
    }
  }
  return true;
}

/// @brief Build a PlayerConfig from parsed CLI options.
PlayerConfig buildPlayerConfig(const CliOptions& opts) {
  PlayerConfig config;
  config.input_path = opts.input_path;
  config.text = opts.text;
  config.read_stdin = opts.input_path.empty() && !opts.has_text;
  config.midi_output = opts.midi_output;
  config.json_output = opts.json_output;
  config.realtime = opts.realtime;
  config.verbose = opts.verbose;
  return config;
}

/// @brief Read a whole stream into `out`.
/// @return False on a read error.
bool readStream(FILE* stream, std::string& out) {
  char buffer[4096];
  size_t bytes_read = 0;
  while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), stream)) > 0) {
    out.append(buffer, bytes_read);
  }
  return std::ferror(stream) == 0;
}

/// @brief Load the notation text described by the config.
/// @return False (after printing a message) if the input cannot be read.
bool loadNotation(const PlayerConfig& config, std::string& notation) {
  if (!config.input_path.empty()) {
    FILE* file = std::fopen(config.input_path.c_str(), "rb");
    if (!file) {
      std::fprintf(stderr, "[playmml] failed to open file: %s\n", config.input_path.c_str());
      return false;
    }
    bool read_ok = readStream(file, notation);
    std::fclose(file);
    if (!read_ok) {
      std::fprintf(stderr, "[playmml] failed to read file: %s\n", config.input_path.c_str());
    }
    return read_ok;
  }
  if (config.read_stdin) {
    if (!readStream(stdin, notation)) {
      std::fprintf(stderr, "[playmml] failed to read stdin\n");
      return false;
    }
    return true;
  }
  notation = config.text;
  return true;
}

/// @brief Fans events out to the recorder and the MIDI exporter.
class HostSink : public playmml::IPlaySink {
 public:
  HostSink(playmml::RecordingSink& recorder, playmml::MidiExportSink& midi)
      : recorder_(recorder), midi_(midi) {}

  void sound(int frequency_hz, int duration_ms) override {
    recorder_.sound(frequency_hz, duration_ms);
    midi_.sound(frequency_hz, duration_ms);
  }

  void pause(int duration_ms) override {
    recorder_.pause(duration_ms);
    midi_.pause(duration_ms);
  }

 private:
  playmml::RecordingSink& recorder_;
  playmml::MidiExportSink& midi_;
};

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return kExitOk;
  }

  PlayerConfig config = buildPlayerConfig(opts);

  std::string notation;
  if (!loadNotation(config, notation)) {
    return kExitIoError;
  }

  playmml::RecordingSink recorder;
  playmml::MidiExportSink midi;
  HostSink host_sink(recorder, midi);
  playmml::PacedSink paced_sink(host_sink);

  playmml::IPlaySink& sink = config.realtime ? static_cast<playmml::IPlaySink&>(paced_sink)
                                             : static_cast<playmml::IPlaySink&>(host_sink);
  playmml::PlayInterpreter interpreter(sink);
  interpreter.setVerbose(config.verbose);

  if (!interpreter.interpret(notation)) {
    const playmml::PlayError& error = interpreter.getError();
    std::fprintf(stderr, "[playmml] error (%s): %s\n", playmml::playErrorCodeToString(error.code),
                 interpreter.getErrorMessage().c_str());
    return kExitPlayError;
  }

  if (config.json_output) {
    std::printf("%s\n", playmml::buildEventsJson(recorder.events()).c_str());
  } else {
    std::printf("Tones:    %zu\n", recorder.toneCount());
    std::printf("Pauses:   %zu\n", recorder.pauseCount());
    std::printf("Duration: %u ms\n", recorder.totalDurationMs());
  }

  if (!config.midi_output.empty()) {
    if (!midi.writeToFile(config.midi_output)) {
      std::fprintf(stderr, "[playmml] failed to write MIDI file: %s\n",
                   config.midi_output.c_str());
      return kExitIoError;
    }
    if (!config.json_output) {
      std::printf("MIDI:     %s\n", config.midi_output.c_str());
    }
  }

  return kExitOk;
}
