#pragma once

/// @file file_input.h
/// @brief Audio file replay backend.

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include "capture/audio_input.h"

namespace chordlive {

/// @brief Replays an audio file as if it were a live mono source.
/// @details Samples are delivered in period_size blocks, paced so that
/// playback runs at `speed` times real time (speed <= 0 delivers as fast as
/// possible). The reported sample rate is the file's own rate. Without loop
/// the capture thread ends after the last block.
class FileAudioInput : public IAudioInput {
 public:
  /// @brief Constructs backend reading config.file_path on open().
  explicit FileAudioInput(const CaptureConfig& config);

  /// @brief Constructs backend over in-memory samples at config.sample_rate.
  FileAudioInput(std::vector<float> samples, const CaptureConfig& config);

  ~FileAudioInput() override;

  FileAudioInput(const FileAudioInput&) = delete;
  FileAudioInput& operator=(const FileAudioInput&) = delete;

  bool open() override;
  bool start() override;
  void stop() override;
  bool is_running() const override { return running_.load(); }

  void set_process_callback(ProcessCallback callback) override {
    process_callback_ = std::move(callback);
  }
  const CaptureConfig& get_config() const override { return config_; }
  std::string backend_name() const override;

  /// @brief Returns the number of samples delivered so far.
  size_t samples_delivered() const { return delivered_.load(); }

  /// @brief Returns the number of samples loaded.
  size_t total_samples() const { return samples_.size(); }

 private:
  void playback_loop();

  CaptureConfig config_;
  std::vector<float> samples_;
  bool loaded_ = false;
  std::atomic<bool> running_{false};
  std::atomic<size_t> delivered_{0};
  std::thread playback_thread_;
  ProcessCallback process_callback_;
};

}  // namespace chordlive
