#pragma once

/// @file pipeline_config.h
/// @brief Configuration for the live chord recognition pipeline.

#include <cstddef>

#include "analysis/stability_controller.h"
#include "feature/chroma.h"

namespace chordlive {

/// @brief Configuration for ChordPipeline.
struct PipelineConfig {
  // Basic parameters
  int sample_rate = 22050;          ///< Sample rate of incoming samples in Hz
  float window_seconds = 0.75f;     ///< Analysis window (and ring buffer) length
  int poll_interval_ms = 100;       ///< Delay between analysis cycles
  float prefill_seconds = 0.5f;     ///< Audio to accumulate before the first cycle
  float gate_rms = 0.0f;            ///< Windows quieter than this analyze as silence (0 = off)

  ChromaConfig chroma;              ///< Chroma extraction parameters
  StabilityConfig stability;        ///< Smoothing and hysteresis parameters

  // Helper methods

  /// @brief Returns analysis window length in samples (at least 1).
  size_t window_samples() const {
    size_t n = static_cast<size_t>(static_cast<double>(sample_rate) * window_seconds);
    return n > 0 ? n : 1;
  }

  /// @brief Returns prefill length in samples.
  size_t prefill_samples() const {
    return static_cast<size_t>(static_cast<double>(sample_rate) * prefill_seconds);
  }

  /// @brief Returns hop between offline analysis cycles in samples (at least 1).
  size_t poll_samples() const {
    size_t n = static_cast<size_t>(static_cast<long long>(sample_rate) * poll_interval_ms / 1000);
    return n > 0 ? n : 1;
  }

  /// @brief Throws ChordliveException if any field is out of range.
  void validate() const;
};

}  // namespace chordlive
