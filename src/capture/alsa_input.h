#pragma once

/// @file alsa_input.h
/// @brief ALSA capture backend.

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "capture/audio_input.h"

namespace chordlive {

/// @brief Live mono capture from an ALSA PCM device.
/// @details Opens the configured device (falling back to "default"),
/// negotiates mono at the nearest supported rate, and runs a blocking read
/// loop on its own thread. FLOAT_LE is preferred; S16_LE samples are scaled
/// by 1/32768. Overruns and read errors are reported and recovered.
class AlsaAudioInput : public IAudioInput {
 public:
  explicit AlsaAudioInput(const CaptureConfig& config);
  ~AlsaAudioInput() override;

  AlsaAudioInput(const AlsaAudioInput&) = delete;
  AlsaAudioInput& operator=(const AlsaAudioInput&) = delete;

  bool open() override;
  bool start() override;
  void stop() override;
  bool is_running() const override { return running_.load(); }

  void set_process_callback(ProcessCallback callback) override {
    process_callback_ = std::move(callback);
  }
  const CaptureConfig& get_config() const override { return config_; }
  std::string backend_name() const override;

  /// @brief Returns the number of overruns recovered so far.
  int xrun_count() const { return xrun_count_.load(); }

 private:
  struct Impl;

  bool setup_alsa();
  void cleanup_alsa();
  void capture_loop();

  CaptureConfig config_;
  std::unique_ptr<Impl> impl_;
  std::atomic<bool> running_{false};
  std::atomic<int> xrun_count_{0};
  std::thread capture_thread_;
  ProcessCallback process_callback_;
};

}  // namespace chordlive
