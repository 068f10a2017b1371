#pragma once

/// @file audio_input.h
/// @brief Capture backend interface delivering mono float samples.

#include <functional>
#include <memory>
#include <string>

namespace chordlive {

/// @brief Available capture backends.
enum class CaptureBackend {
  Alsa,  ///< Live capture from an ALSA PCM device
  File,  ///< Real-time replay of an audio file
};

/// @brief Configuration for capture backends.
struct CaptureConfig {
  CaptureBackend backend = CaptureBackend::Alsa;  ///< Backend to create
  std::string device_name = "default";            ///< ALSA device name
  std::string file_path;                          ///< File to replay (File backend)
  unsigned int sample_rate = 22050;               ///< Requested sample rate in Hz
  unsigned int period_size = 1024;                ///< Frames delivered per callback
  unsigned int num_periods = 4;                   ///< ALSA periods per buffer
  bool loop = false;                              ///< Restart file replay at the end
  float speed = 1.0f;                             ///< File replay speed (1 = real time)
};

/// @brief Returns the name of a capture backend ("alsa", "file").
const char* capture_backend_name(CaptureBackend backend);

/// @brief Source of mono float samples at a fixed rate.
/// @details Samples are delivered on a backend-owned thread through the
/// process callback. Transient errors are reported on stderr and capture
/// continues; start() returns false when no capture is possible.
class IAudioInput {
 public:
  /// @brief Receives an ordered block of samples.
  using ProcessCallback = std::function<void(const float* input, int num_samples)>;

  virtual ~IAudioInput() = default;

  /// @brief Opens the source and negotiates its format without delivering samples.
  /// @details sample_rate() is final once this succeeds. Calling it again is a no-op.
  /// @return False if the source could not be opened
  virtual bool open() = 0;

  /// @brief Opens the source if needed and starts the capture thread.
  /// @return False if the source could not be opened
  virtual bool start() = 0;

  /// @brief Stops capture and joins the capture thread.
  virtual void stop() = 0;

  /// @brief Returns true while the capture thread is running.
  virtual bool is_running() const = 0;

  /// @brief Sets the callback receiving samples (call before start()).
  virtual void set_process_callback(ProcessCallback callback) = 0;

  /// @brief Returns configuration, updated with negotiated values after open().
  virtual const CaptureConfig& get_config() const = 0;

  /// @brief Returns the sample rate of delivered samples.
  unsigned int sample_rate() const { return get_config().sample_rate; }

  /// @brief Returns a short human-readable backend description.
  virtual std::string backend_name() const = 0;
};

/// @brief Creates the backend selected by config.backend.
/// @param config Capture configuration
/// @return Backend instance (not started)
std::unique_ptr<IAudioInput> create_audio_input(const CaptureConfig& config);

}  // namespace chordlive
