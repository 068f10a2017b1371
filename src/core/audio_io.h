#pragma once

/// @file audio_io.h
/// @brief Audio file loading utilities using dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace chordlive {

/// @brief Detected audio format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Result of audio loading: mono samples and sample rate.
using AudioLoadResult = std::tuple<std::vector<float>, int>;

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  size_t max_file_size = 500 * 1024 * 1024;
};

/// @brief Default audio load options.
inline const AudioLoadOptions kDefaultLoadOptions{};

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Detected audio format
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Loads WAV from memory buffer, downmixed to mono.
/// @throws ChordliveException on decode error
AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size);

/// @brief Loads MP3 from memory buffer, downmixed to mono.
/// @throws ChordliveException on decode error
AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size);

/// @brief Loads audio from memory buffer (auto-detect format).
/// @throws ChordliveException on unknown format or decode error
AudioLoadResult load_buffer(const uint8_t* data, size_t size);

/// @brief Loads audio file (auto-detect format).
/// @param path Path to audio file
/// @param options Loading options
/// @return Tuple of (mono samples normalized to [-1,1], sample rate)
/// @throws ChordliveException on file not found, unknown format, file too large, or decode error
AudioLoadResult load_audio(const std::string& path,
                           const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Saves mono samples to a 16-bit PCM WAV file.
/// @param path Output file path
/// @param samples Audio samples (normalized to [-1,1], clipped outside)
/// @param sample_rate Sample rate in Hz
/// @throws ChordliveException on write error
void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate);

}  // namespace chordlive
