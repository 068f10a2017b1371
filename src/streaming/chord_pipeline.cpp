#include "streaming/chord_pipeline.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

#include "util/exception.h"
#include "util/math_utils.h"

namespace chordlive {

namespace {

/// @brief Retry delay when the buffer has no samples yet.
constexpr auto kEmptyRetry = std::chrono::milliseconds(10);

const PipelineConfig& validated(const PipelineConfig& config) {
  config.validate();
  return config;
}

}  // namespace

void PipelineConfig::validate() const {
  CHORDLIVE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "sample rate must be positive");
  CHORDLIVE_CHECK_MSG(window_seconds > 0.0f, ErrorCode::InvalidParameter,
                      "window length must be positive");
  CHORDLIVE_CHECK_MSG(poll_interval_ms > 0, ErrorCode::InvalidParameter,
                      "poll interval must be positive");
  CHORDLIVE_CHECK_MSG(prefill_seconds >= 0.0f, ErrorCode::InvalidParameter,
                      "prefill must not be negative");
  CHORDLIVE_CHECK_MSG(gate_rms >= 0.0f, ErrorCode::InvalidParameter,
                      "gate level must not be negative");
  chroma.validate();
  stability.validate();
}

ChordPipeline::ChordPipeline(const PipelineConfig& config)
    : config_(validated(config)),
      buffer_(config_.window_samples()),
      extractor_(config_.chroma),
      stability_(config_.stability) {}

std::optional<StabilityDecision> ChordPipeline::analyze_once() {
  std::vector<float> window = buffer_.read_last(config_.window_samples());
  if (window.empty()) {
    return std::nullopt;
  }

  Chromagram chroma = zero_chroma();
  if (config_.gate_rms <= 0.0f || rms(window.data(), window.size()) >= config_.gate_rms) {
    chroma = extractor_.extract(window, config_.sample_rate);
  }

  ++cycle_count_;
  return stability_.update(chroma);
}

bool ChordPipeline::wait_for_prefill(const std::atomic<bool>& running) const {
  const uint64_t target = std::min<uint64_t>(config_.prefill_samples(), buffer_.capacity());
  while (running.load()) {
    if (buffer_.total_written() >= target) {
      return true;
    }
    std::this_thread::sleep_for(kEmptyRetry);
  }
  return false;
}

void ChordPipeline::run(const std::atomic<bool>& running, const DisplayCallback& display) {
  const auto interval = std::chrono::milliseconds(config_.poll_interval_ms);

  while (running.load()) {
    try {
      std::optional<StabilityDecision> decision = analyze_once();
      if (!decision) {
        std::this_thread::sleep_for(kEmptyRetry);
        continue;
      }
      if (decision->emit && display) {
        display(decision->result);
      }
    } catch (const std::exception& e) {
      std::cerr << "Warning: Analysis cycle failed: " << e.what() << std::endl;
    }

    std::this_thread::sleep_for(interval);
  }
}

int ChordPipeline::process_offline(const float* samples, size_t n_samples,
                                   const TimedCallback& callback) {
  const size_t step = config_.poll_samples();
  const size_t prefill = std::min(config_.prefill_samples(), buffer_.capacity());
  int cycles = 0;

  size_t pos = 0;
  while (pos < n_samples) {
    size_t n = std::min(step, n_samples - pos);
    on_samples(samples + pos, n);
    pos += n;

    if (pos < prefill) {
      continue;
    }

    std::optional<StabilityDecision> decision = analyze_once();
    if (!decision) {
      continue;
    }
    ++cycles;
    if (decision->emit && callback) {
      callback(static_cast<double>(pos) / config_.sample_rate, decision->result);
    }
  }
  return cycles;
}

void ChordPipeline::reset() {
  buffer_.clear();
  stability_.reset();
  cycle_count_ = 0;
}

}  // namespace chordlive
