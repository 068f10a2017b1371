#include "capture/file_input.h"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "core/audio_io.h"

namespace chordlive {

FileAudioInput::FileAudioInput(const CaptureConfig& config) : config_(config) {}

FileAudioInput::FileAudioInput(std::vector<float> samples, const CaptureConfig& config)
    : config_(config), samples_(std::move(samples)), loaded_(true) {}

FileAudioInput::~FileAudioInput() { stop(); }

std::string FileAudioInput::backend_name() const {
  return config_.file_path.empty() ? std::string("file (memory)") : "file (" + config_.file_path + ")";
}

bool FileAudioInput::open() {
  if (!loaded_) {
    try {
      auto [samples, sample_rate] = load_audio(config_.file_path);
      samples_ = std::move(samples);
      config_.sample_rate = static_cast<unsigned int>(sample_rate);
      loaded_ = true;
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return false;
    }
  }

  if (samples_.empty() || config_.sample_rate == 0) {
    std::cerr << "Error: No audio to replay" << std::endl;
    return false;
  }
  if (config_.period_size == 0) {
    config_.period_size = 1024;
  }
  return true;
}

bool FileAudioInput::start() {
  if (running_.load()) {
    return true;
  }
  if (playback_thread_.joinable()) {
    playback_thread_.join();
  }
  if (!open()) {
    return false;
  }

  delivered_ = 0;
  running_ = true;
  playback_thread_ = std::thread(&FileAudioInput::playback_loop, this);
  return true;
}

void FileAudioInput::stop() {
  running_ = false;
  if (playback_thread_.joinable()) {
    playback_thread_.join();
  }
}

void FileAudioInput::playback_loop() {
  using Clock = std::chrono::steady_clock;

  const size_t period = config_.period_size;
  const bool paced = config_.speed > 0.0f;
  const double seconds_per_sample =
      paced ? 1.0 / (static_cast<double>(config_.sample_rate) * config_.speed) : 0.0;

  auto start_time = Clock::now();
  size_t pos = 0;
  size_t sent = 0;

  while (running_.load()) {
    if (pos >= samples_.size()) {
      if (!config_.loop) {
        break;
      }
      pos = 0;
    }

    size_t n = std::min(period, samples_.size() - pos);
    if (process_callback_) {
      process_callback_(samples_.data() + pos, static_cast<int>(n));
    }
    pos += n;
    sent += n;
    delivered_ = sent;

    if (paced) {
      auto deadline = start_time + std::chrono::duration_cast<Clock::duration>(
                                       std::chrono::duration<double>(sent * seconds_per_sample));
      std::this_thread::sleep_until(deadline);
    }
  }

  running_ = false;
}

}  // namespace chordlive
