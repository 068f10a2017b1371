/// @file chordlive_cli.cpp
/// @brief Command-line interface for live chord recognition.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "capture/audio_input.h"
#include "chordlive.h"
#include "core/audio_io.h"
#include "streaming/chord_pipeline.h"

using namespace chordlive;

namespace {

std::atomic<bool> g_running(true);

void signal_handler(int /*signum*/) { g_running = false; }

}  // namespace

// ============================================================================
// JSON Builder - Fluent interface for building JSON output
// ============================================================================

class JsonBuilder {
 public:
  JsonBuilder& begin_object() {
    append_separator();
    ss_ << "{";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_object() {
    ss_ << "}";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& key(const std::string& k) {
    append_separator();
    ss_ << "\"" << escape(k) << "\": ";
    needs_comma_.back() = false;
    return *this;
  }

  JsonBuilder& value(const std::string& v) {
    append_separator();
    ss_ << "\"" << escape(v) << "\"";
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(const char* v) { return value(std::string(v)); }

  JsonBuilder& value(int v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(double v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(bool v) {
    append_separator();
    ss_ << (v ? "true" : "false");
    needs_comma_.back() = true;
    return *this;
  }

  // Convenience: key-value pairs
  JsonBuilder& kv(const std::string& k, const std::string& v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, const char* v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, int v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, double v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, bool v) { return key(k).value(v); }

  std::string build() const { return ss_.str(); }
  void print() const { std::cout << ss_.str() << "\n" << std::flush; }

 private:
  void append_separator() {
    if (!needs_comma_.empty() && needs_comma_.back()) {
      ss_ << ", ";
    }
  }

  static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
      switch (c) {
        case '"':
          result += "\\\"";
          break;
        case '\\':
          result += "\\\\";
          break;
        case '\n':
          result += "\\n";
          break;
        default:
          result += c;
      }
    }
    return result;
  }

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::string input_file;
  bool json_output = false;
  bool plain_output = false;
  bool quiet = false;
  bool help = false;

  // Capture
  std::string device = "default";
  int sample_rate = 22050;
  float speed = 1.0f;
  bool loop = false;
  float startup_delay = -1.0f;  ///< Negative selects the per-command default

  // Pipeline
  float window_seconds = 0.75f;
  int interval_ms = 100;
  float gate_rms = 0.0f;
  float smoothing = stability_constants::kSmoothing;
  float threshold = stability_constants::kConfidenceThreshold;
  float delta = stability_constants::kConfidenceDelta;
  int n_fft = 2048;
  int hop_length = 512;
  bool magnitude = false;
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--json") {
        args.json_output = true;
      } else if (arg == "--plain") {
        args.plain_output = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (arg == "--loop") {
        args.loop = true;
      } else if (arg == "--magnitude") {
        args.magnitude = true;
      } else if (try_parse_value_option(args, arg, argv, i, argc)) {
        // Handled
      } else if (arg.substr(0, 2) == "--") {
        throw ChordliveException(ErrorCode::InvalidParameter, "Unknown option '" + arg + "'");
      } else if (args.command.empty()) {
        args.command = arg;
      } else if (args.input_file.empty()) {
        args.input_file = arg;
      }
    }

    return args;
  }

 private:
  static bool try_parse_value_option(CliArgs& args, const std::string& arg, char* argv[], int& i,
                                     int argc) {
    static const std::map<std::string, std::function<void(CliArgs&, const std::string&)>>
        value_opts = {
            {"--device", [](CliArgs& a, const std::string& v) { a.device = v; }},
            {"--rate", [](CliArgs& a, const std::string& v) { a.sample_rate = std::stoi(v); }},
            {"--window", [](CliArgs& a, const std::string& v) { a.window_seconds = std::stof(v); }},
            {"--interval", [](CliArgs& a, const std::string& v) { a.interval_ms = std::stoi(v); }},
            {"--smoothing", [](CliArgs& a, const std::string& v) { a.smoothing = std::stof(v); }},
            {"--threshold", [](CliArgs& a, const std::string& v) { a.threshold = std::stof(v); }},
            {"--delta", [](CliArgs& a, const std::string& v) { a.delta = std::stof(v); }},
            {"--gate", [](CliArgs& a, const std::string& v) { a.gate_rms = std::stof(v); }},
            {"--n-fft", [](CliArgs& a, const std::string& v) { a.n_fft = std::stoi(v); }},
            {"--hop-length", [](CliArgs& a, const std::string& v) { a.hop_length = std::stoi(v); }},
            {"--speed", [](CliArgs& a, const std::string& v) { a.speed = std::stof(v); }},
            {"--startup-delay",
             [](CliArgs& a, const std::string& v) { a.startup_delay = std::stof(v); }},
        };

    auto it = value_opts.find(arg);
    if (it == value_opts.end()) {
      return false;
    }
    if (i + 1 >= argc) {
      throw ChordliveException(ErrorCode::InvalidParameter, "Missing value for " + arg);
    }
    it->second(args, argv[++i]);
    return true;
  }
};

// ============================================================================
// Configuration
// ============================================================================

PipelineConfig make_pipeline_config(const CliArgs& args, int sample_rate) {
  PipelineConfig config;
  config.sample_rate = sample_rate;
  config.window_seconds = args.window_seconds;
  config.poll_interval_ms = args.interval_ms;
  config.gate_rms = args.gate_rms;
  config.chroma.n_fft = args.n_fft;
  config.chroma.hop_length = args.hop_length;
  config.chroma.weighting =
      args.magnitude ? SpectralWeighting::Magnitude : SpectralWeighting::Power;
  config.stability.smoothing = args.smoothing;
  config.stability.confidence_threshold = args.threshold;
  config.stability.confidence_delta = args.delta;
  return config;
}

// ============================================================================
// Display
// ============================================================================

const char* quality_name(const ChordResult& result) {
  if (!result.is_chord()) return "none";
  return result.quality == ChordQuality::Minor ? "minor" : "major";
}

void print_json_result(const ChordResult& result, double time_sec, bool with_time) {
  JsonBuilder json;
  json.begin_object();
  if (with_time) json.kv("time", time_sec);
  json.kv("chord", result.label)
      .kv("confidence", static_cast<double>(result.confidence))
      .kv("root", result.root)
      .kv("quality", quality_name(result))
      .end_object()
      .print();
}

void print_banner(const ChordResult& result) {
  constexpr int kWidth = 34;
  std::string text = result.to_string();
  int pad = std::max(0, kWidth - static_cast<int>(text.size()));
  int left = pad / 2;
  std::string border(kWidth, '=');
  std::string blank(kWidth, ' ');

  // Clear screen and home cursor
  std::cout << "\033[2J\033[H";
  std::cout << "+" << border << "+\n";
  std::cout << "|" << blank << "|\n";
  std::cout << "|" << std::string(left, ' ') << text << std::string(pad - left, ' ') << "|\n";
  std::cout << "|" << blank << "|\n";
  std::cout << "+" << border << "+\n";
  std::cout << "  Press Ctrl+C to quit\n" << std::flush;
}

ChordPipeline::DisplayCallback make_live_display(const CliArgs& args) {
  if (args.json_output) {
    return [](const ChordResult& r) { print_json_result(r, 0.0, false); };
  }
  if (args.plain_output) {
    return [](const ChordResult& r) { std::cout << r.to_string() << "\n" << std::flush; };
  }
  return print_banner;
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonBuilder().begin_object().kv("cli_version", "1.0.0").kv("lib_version", version()).end_object().print();
  } else {
    std::cout << "chordlive-cli version 1.0.0\n";
    std::cout << "libchordlive version " << version() << "\n";
  }
  return 0;
}

void sleep_while_running(float seconds) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                      std::chrono::duration<float>(seconds));
  while (g_running.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

/// @brief Runs the live loop against a capture backend until interrupted or exhausted.
int run_live(const CliArgs& args, const CaptureConfig& capture, float default_delay) {
  // Fail on bad options before touching the device
  make_pipeline_config(args, capture.sample_rate > 0 ? static_cast<int>(capture.sample_rate) : 1)
      .validate();

  // Declared before the input so the capture thread is joined first
  std::unique_ptr<ChordPipeline> pipeline;

  std::unique_ptr<IAudioInput> input = create_audio_input(capture);
  if (!input->open()) {
    std::cerr << "Error: Cannot open " << capture_backend_name(capture.backend) << " capture\n";
    return 1;
  }

  // The backend reports the rate it actually delivers once opened
  pipeline = std::make_unique<ChordPipeline>(
      make_pipeline_config(args, static_cast<int>(input->sample_rate())));
  ChordPipeline* sink = pipeline.get();
  input->set_process_callback([sink](const float* samples, int n) {
    if (n > 0) {
      sink->on_samples(samples, static_cast<size_t>(n));
    }
  });

  if (!input->start()) {
    std::cerr << "Error: Cannot start " << capture_backend_name(capture.backend) << " capture\n";
    return 1;
  }

  if (!args.quiet) {
    const PipelineConfig& config = pipeline->config();
    std::cerr << "Listening on " << input->backend_name() << "\n";
    std::cerr << "  Sample Rate: " << config.sample_rate << " Hz\n";
    std::cerr << "  Window:      " << config.window_seconds << "s (" << config.window_samples()
              << " samples)\n";
    std::cerr << "  Interval:    " << config.poll_interval_ms << " ms\n";
  }

  float delay = args.startup_delay >= 0.0f ? args.startup_delay : default_delay;
  if (delay > 0.0f) {
    if (!args.quiet) std::cerr << "Starting in " << delay << "s...\n";
    sleep_while_running(delay);
  }

  // End the loop when the source runs dry (file replay without --loop)
  std::thread watcher([&input]() {
    while (g_running.load() && input->is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    g_running = false;
  });

  ChordPipeline::DisplayCallback display = make_live_display(args);
  if (pipeline->wait_for_prefill(g_running)) {
    pipeline->run(g_running, display);
  }

  const bool exhausted = !input->is_running();
  g_running = false;
  watcher.join();
  input->stop();

  // A finished source may have delivered audio no cycle has seen yet
  if (exhausted) {
    std::optional<StabilityDecision> decision = pipeline->analyze_once();
    if (decision && decision->emit) {
      display(decision->result);
    }
  }

  if (!args.quiet) {
    std::cerr << "\nStopped after " << pipeline->cycle_count() << " analysis cycles\n";
  }
  return 0;
}

int cmd_listen(const CliArgs& args) {
  CaptureConfig capture;
  capture.backend = CaptureBackend::Alsa;
  capture.device_name = args.device;
  capture.sample_rate = static_cast<unsigned int>(std::max(args.sample_rate, 0));
  return run_live(args, capture, 2.0f);
}

int cmd_replay(const CliArgs& args) {
  CaptureConfig capture;
  capture.backend = CaptureBackend::File;
  capture.file_path = args.input_file;
  capture.loop = args.loop;
  capture.speed = args.speed;
  return run_live(args, capture, 0.0f);
}

int cmd_analyze(const CliArgs& args) {
  if (!args.quiet && !args.json_output) {
    std::cerr << "Loading " << args.input_file << "...\n";
  }

  auto [samples, sample_rate] = load_audio(args.input_file);
  if (samples.empty()) {
    std::cerr << "Error: Failed to load audio file\n";
    return 1;
  }

  if (!args.quiet && !args.json_output) {
    std::cerr << "Loaded " << static_cast<float>(samples.size()) / sample_rate << "s @ "
              << sample_rate << "Hz\n";
  }

  ChordPipeline pipeline(make_pipeline_config(args, sample_rate));

  int emitted = 0;
  int cycles = pipeline.process_offline(samples, [&](double time_sec, const ChordResult& r) {
    ++emitted;
    if (args.json_output) {
      print_json_result(r, time_sec, true);
    } else {
      std::cout << std::fixed << std::setprecision(2) << std::setw(8) << time_sec << "s  "
                << r.to_string() << "\n";
    }
  });

  if (!args.quiet && !args.json_output) {
    std::cerr << cycles << " analysis cycles, " << emitted << " changes\n";
  }
  return 0;
}

// ============================================================================
// Command Registry
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
  bool requires_file;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"listen", "Recognize chords from the microphone", cmd_listen, false},
      {"replay", "Recognize chords from a file played in real time", cmd_replay, true},
      {"analyze", "Print chord changes of a file with time stamps", cmd_analyze, true},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options] [audio_file]\n\n";

  std::cerr << "COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nOUTPUT OPTIONS:\n"
            << "  --json               One JSON object per chord change\n"
            << "  --plain              One line per chord change (no banner)\n"
            << "  --quiet, -q          Suppress status output\n"
            << "  --help, -h           Show help\n"
            << "\nCAPTURE OPTIONS:\n"
            << "  --device <name>      ALSA capture device (default: default)\n"
            << "  --rate <int>         Requested sample rate (default: 22050)\n"
            << "  --speed <float>      Replay speed, 0 = unpaced (default: 1.0)\n"
            << "  --loop               Restart replay at end of file\n"
            << "  --startup-delay <s>  Delay before analysis (default: 2 for listen)\n"
            << "\nANALYSIS OPTIONS:\n"
            << "  --window <s>         Analysis window (default: 0.75)\n"
            << "  --interval <ms>      Analysis interval (default: 100)\n"
            << "  --smoothing <float>  History weight in [0, 1) (default: 0.7)\n"
            << "  --threshold <float>  Minimum confidence (default: 0.55)\n"
            << "  --delta <float>      Confidence change that re-emits (default: 0.05)\n"
            << "  --gate <float>       RMS below which input counts as silence (default: off)\n"
            << "  --n-fft <int>        FFT size (default: 2048)\n"
            << "  --hop-length <int>   Hop length (default: 512)\n"
            << "  --magnitude          Accumulate magnitude instead of power\n"
            << "\nExamples:\n"
            << "  " << prog << " listen\n"
            << "  " << prog << " listen --device hw:1,0 --plain\n"
            << "  " << prog << " analyze song.wav --json\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    CliArgs args = ArgParser::parse(argc, argv);

    if (args.help) {
      print_usage(argv[0]);
      return 0;
    }

    if (args.command.empty()) {
      std::cerr << "Error: No command specified\n\n";
      print_usage(argv[0]);
      return 1;
    }

    // Version command (no audio needed)
    if (args.command == "version") {
      return cmd_version(args);
    }

    // Find command
    const CommandInfo* cmd = find_command(args.command);
    if (!cmd) {
      std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
      print_usage(argv[0]);
      return 1;
    }

    // Check for audio file
    if (cmd->requires_file && args.input_file.empty()) {
      std::cerr << "Error: Missing audio file\n\n";
      print_usage(argv[0]);
      return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    return cmd->handler(args);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
