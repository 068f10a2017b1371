#include "capture/alsa_input.h"

#include <alsa/asoundlib.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <vector>

namespace chordlive {

namespace {

/// @brief Upper bound on a single wait for data, so stop() is noticed promptly.
constexpr int kWaitTimeoutMs = 100;

/// @brief Back-off after an unrecoverable read error.
constexpr auto kErrorBackoff = std::chrono::milliseconds(10);

}  // namespace

struct AlsaAudioInput::Impl {
  snd_pcm_t* pcm_handle = nullptr;
  snd_pcm_format_t sample_format = SND_PCM_FORMAT_FLOAT_LE;
  snd_pcm_uframes_t period_size = 0;
};

AlsaAudioInput::AlsaAudioInput(const CaptureConfig& config)
    : config_(config), impl_(std::make_unique<Impl>()) {}

AlsaAudioInput::~AlsaAudioInput() { stop(); }

std::string AlsaAudioInput::backend_name() const { return "ALSA (" + config_.device_name + ")"; }

bool AlsaAudioInput::open() {
  if (impl_->pcm_handle) {
    return true;
  }
  return setup_alsa();
}

bool AlsaAudioInput::start() {
  if (running_.load()) {
    return true;
  }
  if (!open()) {
    return false;
  }
  running_ = true;
  capture_thread_ = std::thread(&AlsaAudioInput::capture_loop, this);
  return true;
}

void AlsaAudioInput::stop() {
  running_ = false;
  if (capture_thread_.joinable()) {
    capture_thread_.join();
  }
  cleanup_alsa();
}

bool AlsaAudioInput::setup_alsa() {
  std::vector<std::string> candidates;
  if (!config_.device_name.empty()) candidates.push_back(config_.device_name);
  if (config_.device_name != "default") candidates.push_back("default");

  std::string opened_device;
  int err = 0;
  for (const auto& dev : candidates) {
    err = snd_pcm_open(&impl_->pcm_handle, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err == 0) {
      opened_device = dev;
      break;
    }
  }
  if (opened_device.empty()) {
    std::cerr << "Error: Cannot open any audio capture device (last tried: "
              << (candidates.empty() ? std::string("<none>") : candidates.back())
              << "): " << snd_strerror(err) << std::endl;
    impl_->pcm_handle = nullptr;
    return false;
  }
  if (opened_device != config_.device_name) {
    std::cerr << "Using capture device: " << opened_device << std::endl;
    config_.device_name = opened_device;
  }

  snd_pcm_t* pcm = impl_->pcm_handle;
  snd_pcm_hw_params_t* hw_params;
  snd_pcm_hw_params_alloca(&hw_params);

  err = snd_pcm_hw_params_any(pcm, hw_params);
  if (err < 0) {
    std::cerr << "Error: Cannot initialize hardware parameters: " << snd_strerror(err)
              << std::endl;
    cleanup_alsa();
    return false;
  }

  err = snd_pcm_hw_params_set_access(pcm, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
  if (err < 0) {
    std::cerr << "Error: Cannot set access type: " << snd_strerror(err) << std::endl;
    cleanup_alsa();
    return false;
  }

  impl_->sample_format = SND_PCM_FORMAT_FLOAT_LE;
  err = snd_pcm_hw_params_set_format(pcm, hw_params, impl_->sample_format);
  if (err < 0) {
    impl_->sample_format = SND_PCM_FORMAT_S16_LE;
    err = snd_pcm_hw_params_set_format(pcm, hw_params, impl_->sample_format);
    if (err < 0) {
      std::cerr << "Error: Cannot set sample format: " << snd_strerror(err) << std::endl;
      cleanup_alsa();
      return false;
    }
  }

  err = snd_pcm_hw_params_set_channels(pcm, hw_params, 1);
  if (err < 0) {
    std::cerr << "Error: Cannot set mono capture: " << snd_strerror(err) << std::endl;
    cleanup_alsa();
    return false;
  }

  unsigned int rate = config_.sample_rate;
  err = snd_pcm_hw_params_set_rate_near(pcm, hw_params, &rate, nullptr);
  if (err < 0) {
    std::cerr << "Error: Cannot set sample rate: " << snd_strerror(err) << std::endl;
    cleanup_alsa();
    return false;
  }
  if (rate != config_.sample_rate) {
    std::cerr << "Sample rate adjusted to " << rate << " Hz" << std::endl;
  }

  snd_pcm_uframes_t period_size = config_.period_size;
  err = snd_pcm_hw_params_set_period_size_near(pcm, hw_params, &period_size, nullptr);
  if (err < 0) {
    std::cerr << "Error: Cannot set period size: " << snd_strerror(err) << std::endl;
    cleanup_alsa();
    return false;
  }

  unsigned int periods = config_.num_periods;
  err = snd_pcm_hw_params_set_periods_near(pcm, hw_params, &periods, nullptr);
  if (err < 0) {
    std::cerr << "Error: Cannot set periods: " << snd_strerror(err) << std::endl;
    cleanup_alsa();
    return false;
  }

  err = snd_pcm_hw_params(pcm, hw_params);
  if (err < 0) {
    std::cerr << "Error: Cannot set hardware parameters: " << snd_strerror(err) << std::endl;
    cleanup_alsa();
    return false;
  }

  err = snd_pcm_prepare(pcm);
  if (err < 0) {
    std::cerr << "Error: Cannot prepare audio interface: " << snd_strerror(err) << std::endl;
    cleanup_alsa();
    return false;
  }

  snd_pcm_hw_params_get_period_size(hw_params, &period_size, nullptr);
  snd_pcm_hw_params_get_rate(hw_params, &rate, nullptr);

  impl_->period_size = period_size;
  config_.sample_rate = rate;
  config_.period_size = static_cast<unsigned int>(period_size);
  return true;
}

void AlsaAudioInput::cleanup_alsa() {
  if (impl_->pcm_handle) {
    snd_pcm_close(impl_->pcm_handle);
    impl_->pcm_handle = nullptr;
  }
}

void AlsaAudioInput::capture_loop() {
  snd_pcm_t* pcm = impl_->pcm_handle;
  const snd_pcm_uframes_t period_size = impl_->period_size;
  const bool is_float = impl_->sample_format == SND_PCM_FORMAT_FLOAT_LE;

  std::vector<float> buffer_f(period_size);
  std::vector<int16_t> buffer_s16;
  if (!is_float) {
    buffer_s16.resize(period_size);
  }

  while (running_.load()) {
    // Bounded wait keeps the loop responsive to stop()
    int ready = snd_pcm_wait(pcm, kWaitTimeoutMs);
    if (ready == 0) {
      continue;
    }

    snd_pcm_sframes_t frames_read = 0;
    if (is_float) {
      frames_read = snd_pcm_readi(pcm, buffer_f.data(), period_size);
    } else {
      frames_read = snd_pcm_readi(pcm, buffer_s16.data(), period_size);
    }

    if (frames_read == -EAGAIN) {
      continue;
    }
    if (frames_read == -EPIPE) {
      xrun_count_++;
      snd_pcm_prepare(pcm);
      continue;
    }
    if (frames_read < 0) {
      int err = static_cast<int>(frames_read);
      std::cerr << "Warning: Capture read error: " << snd_strerror(err) << std::endl;
      if (snd_pcm_recover(pcm, err, 1) < 0) {
        std::this_thread::sleep_for(kErrorBackoff);
      }
      continue;
    }
    if (frames_read == 0 || !process_callback_) {
      continue;
    }

    if (!is_float) {
      const float scale = 1.0f / 32768.0f;
      for (snd_pcm_sframes_t i = 0; i < frames_read; ++i) {
        buffer_f[i] = static_cast<float>(buffer_s16[i]) * scale;
      }
    }
    process_callback_(buffer_f.data(), static_cast<int>(frames_read));
  }
}

}  // namespace chordlive
