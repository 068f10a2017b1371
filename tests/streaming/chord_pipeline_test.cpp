/// @file chord_pipeline_test.cpp
/// @brief Tests for the live chord recognition pipeline.

#include "streaming/chord_pipeline.h"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <chrono>
#include <cmath>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "util/exception.h"

using namespace chordlive;

namespace {

constexpr double kTwoPi = 6.283185307179586;

std::vector<float> create_tones(const std::vector<double>& freqs, size_t n_samples, int sr,
                                float amplitude = 0.3f) {
  std::vector<float> samples(n_samples, 0.0f);
  for (double freq : freqs) {
    for (size_t i = 0; i < n_samples; ++i) {
      samples[i] += amplitude * static_cast<float>(std::sin(kTwoPi * freq * i / sr));
    }
  }
  return samples;
}

const std::vector<double> kCMajor = {261.63, 329.63, 392.00};
const std::vector<double> kAMinor = {220.00, 261.63, 329.63};

}  // namespace

TEST_CASE("PipelineConfig defaults", "[chord_pipeline]") {
  PipelineConfig config;
  REQUIRE(config.sample_rate == 22050);
  REQUIRE(config.poll_interval_ms == 100);
  REQUIRE(config.window_samples() == 16537);
  REQUIRE(config.prefill_samples() == 11025);
  REQUIRE(config.poll_samples() == 2205);
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("PipelineConfig validation", "[chord_pipeline]") {
  PipelineConfig config;

  SECTION("window") {
    config.window_seconds = 0.0f;
    REQUIRE_THROWS_AS(ChordPipeline(config), ChordliveException);
  }

  SECTION("interval") {
    config.poll_interval_ms = 0;
    REQUIRE_THROWS_AS(config.validate(), ChordliveException);
  }

  SECTION("gate") {
    config.gate_rms = -0.1f;
    REQUIRE_THROWS_AS(config.validate(), ChordliveException);
  }

  SECTION("nested stability config") {
    config.stability.smoothing = 1.0f;
    REQUIRE_THROWS_AS(config.validate(), ChordliveException);
  }

  SECTION("nested chroma config") {
    config.chroma.n_fft = 1001;
    REQUIRE_THROWS_AS(config.validate(), ChordliveException);
  }
}

TEST_CASE("ChordPipeline empty buffer has nothing to analyze", "[chord_pipeline]") {
  ChordPipeline pipeline;
  REQUIRE_FALSE(pipeline.analyze_once().has_value());
  REQUIRE(pipeline.cycle_count() == 0);
}

TEST_CASE("ChordPipeline recognizes a C major triad", "[chord_pipeline]") {
  PipelineConfig config;
  ChordPipeline pipeline(config);

  auto samples = create_tones(kCMajor, config.window_samples(), config.sample_rate);
  pipeline.on_samples(samples.data(), samples.size());

  auto decision = pipeline.analyze_once();
  REQUIRE(decision.has_value());
  REQUIRE(decision->emit);
  REQUIRE(decision->result.label == "C");
  REQUIRE(decision->result.confidence >= 0.9f);
  REQUIRE(pipeline.cycle_count() == 1);

  // The same audio again is stable
  auto again = pipeline.analyze_once();
  REQUIRE(again.has_value());
  REQUIRE_FALSE(again->emit);
}

TEST_CASE("ChordPipeline silence emits nothing", "[chord_pipeline]") {
  PipelineConfig config;
  ChordPipeline pipeline(config);

  std::vector<float> silence(config.window_samples(), 0.0f);
  pipeline.on_samples(silence.data(), silence.size());

  for (int i = 0; i < 3; ++i) {
    auto decision = pipeline.analyze_once();
    REQUIRE(decision.has_value());
    REQUIRE_FALSE(decision->emit);
    REQUIRE(decision->result.label == kNoChordLabel);
  }
}

TEST_CASE("ChordPipeline short input analyzes as silence", "[chord_pipeline]") {
  ChordPipeline pipeline;
  auto samples = create_tones(kCMajor, 1000, 22050);
  pipeline.on_samples(samples.data(), samples.size());

  auto decision = pipeline.analyze_once();
  REQUIRE(decision.has_value());
  REQUIRE_FALSE(decision->emit);
}

TEST_CASE("ChordPipeline noise gate", "[chord_pipeline]") {
  PipelineConfig config;
  config.gate_rms = 0.5f;
  ChordPipeline pipeline(config);

  // RMS of three 0.3-amplitude sines is about 0.37
  auto samples = create_tones(kCMajor, config.window_samples(), config.sample_rate);
  pipeline.on_samples(samples.data(), samples.size());

  auto decision = pipeline.analyze_once();
  REQUIRE(decision.has_value());
  REQUIRE_FALSE(decision->emit);
  REQUIRE(decision->result.label == kNoChordLabel);

  // Louder input passes the gate
  auto loud = create_tones(kCMajor, config.window_samples(), config.sample_rate, 0.6f);
  pipeline.on_samples(loud.data(), loud.size());
  REQUIRE(pipeline.analyze_once()->result.label == "C");
}

TEST_CASE("ChordPipeline follows a chord change", "[chord_pipeline]") {
  PipelineConfig config;
  ChordPipeline pipeline(config);

  auto c_major = create_tones(kCMajor, config.window_samples(), config.sample_rate);
  pipeline.on_samples(c_major.data(), c_major.size());
  REQUIRE(pipeline.analyze_once()->result.label == "C");

  auto a_minor = create_tones(kAMinor, config.window_samples(), config.sample_rate);
  pipeline.on_samples(a_minor.data(), a_minor.size());

  std::string last;
  for (int i = 0; i < 10; ++i) {
    auto decision = pipeline.analyze_once();
    if (decision && decision->emit) last = decision->result.label;
  }
  REQUIRE(last == "Am");
}

TEST_CASE("ChordPipeline process_offline", "[chord_pipeline]") {
  PipelineConfig config;
  ChordPipeline pipeline(config);
  const int sr = config.sample_rate;

  auto samples = create_tones(kCMajor, static_cast<size_t>(sr), sr);
  auto tail = create_tones(kAMinor, static_cast<size_t>(2 * sr), sr);
  samples.insert(samples.end(), tail.begin(), tail.end());

  std::vector<std::pair<double, std::string>> changes;
  int cycles = pipeline.process_offline(samples, [&](double t, const ChordResult& r) {
    changes.emplace_back(t, r.label);
  });

  // One cycle per 100 ms step from the 0.5 s prefill onwards
  REQUIRE(cycles == 26);
  REQUIRE(pipeline.cycle_count() == cycles);

  REQUIRE_FALSE(changes.empty());
  REQUIRE(changes.front().second == "C");
  REQUIRE(changes.front().first >= 0.5);
  REQUIRE(changes.back().second == "Am");
  REQUIRE(changes.back().first > 1.0);
}

TEST_CASE("ChordPipeline wait_for_prefill", "[chord_pipeline]") {
  PipelineConfig config;
  config.prefill_seconds = 0.1f;
  ChordPipeline pipeline(config);

  SECTION("returns false once stopped") {
    std::atomic<bool> running(false);
    REQUIRE_FALSE(pipeline.wait_for_prefill(running));
  }

  SECTION("returns true once enough audio arrived") {
    std::vector<float> samples(config.prefill_samples(), 0.0f);
    pipeline.on_samples(samples.data(), samples.size());
    std::atomic<bool> running(true);
    REQUIRE(pipeline.wait_for_prefill(running));
  }
}

TEST_CASE("ChordPipeline run loop", "[chord_pipeline]") {
  PipelineConfig config;
  config.poll_interval_ms = 10;
  ChordPipeline pipeline(config);

  auto samples = create_tones(kCMajor, config.window_samples(), config.sample_rate);
  pipeline.on_samples(samples.data(), samples.size());

  std::atomic<bool> running(true);
  std::mutex mutex;
  std::vector<std::string> shown;

  std::thread loop([&]() {
    pipeline.run(running, [&](const ChordResult& r) {
      std::lock_guard<std::mutex> lock(mutex);
      shown.push_back(r.label);
    });
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  running = false;
  loop.join();

  std::lock_guard<std::mutex> lock(mutex);
  REQUIRE(shown.size() == 1);
  REQUIRE(shown.front() == "C");
}

TEST_CASE("ChordPipeline run loop retries an empty buffer quickly", "[chord_pipeline]") {
  PipelineConfig config;
  config.poll_interval_ms = 500;
  ChordPipeline pipeline(config);

  std::atomic<bool> running(true);
  std::atomic<bool> shown(false);
  std::thread loop([&]() {
    pipeline.run(running, [&](const ChordResult& r) {
      if (r.label == "C") shown = true;
    });
  });

  // Audio arrives after the loop has started polling an empty buffer
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  auto samples = create_tones(kCMajor, config.window_samples(), config.sample_rate);
  pipeline.on_samples(samples.data(), samples.size());

  // Well before a full poll interval has elapsed
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
  while (!shown.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  bool shown_in_time = shown.load();

  running = false;
  loop.join();

  REQUIRE(shown_in_time);
}

TEST_CASE("ChordPipeline reset", "[chord_pipeline]") {
  ChordPipeline pipeline;
  auto samples = create_tones(kCMajor, pipeline.config().window_samples(), 22050);
  pipeline.on_samples(samples.data(), samples.size());
  REQUIRE(pipeline.analyze_once()->emit);

  pipeline.reset();
  REQUIRE(pipeline.buffer().total_written() == 0);
  REQUIRE(pipeline.cycle_count() == 0);
  REQUIRE_FALSE(pipeline.analyze_once().has_value());

  pipeline.on_samples(samples.data(), samples.size());
  REQUIRE(pipeline.analyze_once()->emit);
}
