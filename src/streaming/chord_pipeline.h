#pragma once

/// @file chord_pipeline.h
/// @brief Live chord recognition loop over a shared ring buffer.

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "analysis/stability_controller.h"
#include "core/ring_buffer.h"
#include "feature/chroma.h"
#include "streaming/pipeline_config.h"

namespace chordlive {

/// @brief Wires the ring buffer, chroma extraction and stabilization together.
/// @details The capture thread feeds on_samples(); the analysis thread calls
/// analyze_once() (or run(), which polls it) and reads the most recent window.
/// The ring buffer is the only state shared between the two.
///
/// Usage:
/// @code
///   ChordPipeline pipeline(config);
///   input->set_process_callback([&](const float* s, int n) { pipeline.on_samples(s, n); });
///   input->start();
///   pipeline.run(running, [](const ChordResult& r) { std::cout << r.to_string() << "\n"; });
/// @endcode
class ChordPipeline {
 public:
  /// @brief Receives each surfaced result.
  using DisplayCallback = std::function<void(const ChordResult& result)>;

  /// @brief Receives each surfaced result with its stream time in seconds.
  using TimedCallback = std::function<void(double time_sec, const ChordResult& result)>;

  /// @brief Constructs pipeline.
  /// @param config Pipeline configuration
  /// @throws ChordliveException if the configuration is invalid
  explicit ChordPipeline(const PipelineConfig& config = PipelineConfig());

  ChordPipeline(const ChordPipeline&) = delete;
  ChordPipeline& operator=(const ChordPipeline&) = delete;

  /// @brief Producer sink: appends captured samples.
  /// @param samples Pointer to samples
  /// @param n_samples Number of samples
  void on_samples(const float* samples, size_t n_samples) { buffer_.push(samples, n_samples); }

  /// @brief Runs one analysis cycle over the most recent window.
  /// @return Decision for the cycle, or std::nullopt if no samples are available yet
  std::optional<StabilityDecision> analyze_once();

  /// @brief Blocks until prefill_seconds of audio has arrived or running is cleared.
  /// @return True if the prefill completed
  bool wait_for_prefill(const std::atomic<bool>& running) const;

  /// @brief Polls analyze_once() every poll_interval_ms until running is cleared.
  /// @param running Run flag (cleared from another thread or a signal handler)
  /// @param display Called for every surfaced result
  /// @details A cycle runs immediately and the interval is slept after it. An
  /// empty buffer is retried after 10 ms instead. Errors in a cycle are
  /// reported on stderr and the loop continues.
  void run(const std::atomic<bool>& running, const DisplayCallback& display);

  /// @brief Analyzes a complete recording without real-time pacing.
  /// @param samples Mono samples at config().sample_rate
  /// @param n_samples Number of samples
  /// @param callback Called for every surfaced result
  /// @return Number of analysis cycles run
  /// @details Samples are fed in poll-interval steps and a cycle runs after
  ///          each step once the prefill is reached, as the live loop would.
  int process_offline(const float* samples, size_t n_samples, const TimedCallback& callback);

  /// @brief Analyzes a vector of samples without real-time pacing.
  int process_offline(const std::vector<float>& samples, const TimedCallback& callback) {
    return process_offline(samples.data(), samples.size(), callback);
  }

  /// @brief Clears buffered audio and stabilization state.
  void reset();

  /// @brief Returns the shared sample buffer.
  const RingBuffer& buffer() const { return buffer_; }

  /// @brief Returns the stabilization stage.
  const StabilityController& stability() const { return stability_; }

  /// @brief Returns configuration.
  const PipelineConfig& config() const { return config_; }

  /// @brief Returns number of analysis cycles run.
  int cycle_count() const { return cycle_count_; }

 private:
  PipelineConfig config_;
  RingBuffer buffer_;
  ChromaExtractor extractor_;
  StabilityController stability_;
  int cycle_count_ = 0;
};

}  // namespace chordlive
