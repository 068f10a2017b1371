#pragma once

/// @file chordlive.h
/// @brief Main header for chordlive - live chord recognition library.
/// @details Include this file to access all chordlive functionality.

// Version information
#define CHORDLIVE_VERSION_MAJOR 1
#define CHORDLIVE_VERSION_MINOR 0
#define CHORDLIVE_VERSION_PATCH 0
#define CHORDLIVE_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/audio_io.h"
#include "core/convert.h"
#include "core/fft.h"
#include "core/ring_buffer.h"
#include "core/window.h"

// Features
#include "feature/chroma.h"

// Analysis
#include "analysis/chord_matcher.h"
#include "analysis/chord_templates.h"
#include "analysis/stability_controller.h"

// Capture
#include "capture/audio_input.h"

// Streaming
#include "streaming/chord_pipeline.h"
#include "streaming/pipeline_config.h"

namespace chordlive {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return CHORDLIVE_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return CHORDLIVE_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return CHORDLIVE_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return CHORDLIVE_VERSION_PATCH; }

}  // namespace chordlive
