#pragma once

/// @file exception.h
/// @brief Exception classes for chordlive.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace chordlive {

/// @brief Base exception class for chordlive errors.
class ChordliveException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit ChordliveException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  ChordliveException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def CHORDLIVE_CHECK
/// @brief Throws ChordliveException if condition is false.
#define CHORDLIVE_CHECK(cond, code)   \
  do {                                \
    if (!(cond)) {                    \
      throw ChordliveException(code); \
    }                                 \
  } while (0)

/// @def CHORDLIVE_CHECK_MSG
/// @brief Throws ChordliveException with custom message if condition is false.
#define CHORDLIVE_CHECK_MSG(cond, code, msg) \
  do {                                       \
    if (!(cond)) {                           \
      throw ChordliveException(code, msg);   \
    }                                        \
  } while (0)

}  // namespace chordlive
