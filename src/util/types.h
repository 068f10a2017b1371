#pragma once

/// @file types.h
/// @brief Common type definitions for chordlive.

#include <array>
#include <cstddef>
#include <cstdint>

namespace chordlive {

/// @brief Number of pitch classes in an octave.
constexpr int kNumPitchClasses = 12;

/// @brief 12-bin pitch-class energy vector (C=0 ... B=11).
using Chromagram = std::array<float, kNumPitchClasses>;

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
  DeviceUnavailable,
  CaptureFailed,
};

/// @brief Pitch class (0-11, C=0).
enum class PitchClass : int {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11,
};

/// @brief Chord quality types recognized by the matcher.
enum class ChordQuality {
  Major,
  Minor,
};

/// @brief Returns the name of a pitch class.
/// @param pc Pitch class
/// @return String name (e.g., "C", "C#")
inline const char* pitch_class_name(PitchClass pc) {
  static const char* names[] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
  int idx = static_cast<int>(pc);
  if (idx < 0 || idx >= kNumPitchClasses) {
    return "?";
  }
  return names[idx];
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::DeviceUnavailable:
      return "Audio device unavailable";
    case ErrorCode::CaptureFailed:
      return "Audio capture failed";
  }
  return "Unknown error";
}

}  // namespace chordlive
