/// @file convert.cpp
/// @brief Implementation of frequency and pitch conversions.

#include "core/convert.h"

#include <cmath>

#include "util/types.h"

namespace chordlive {

double hz_to_midi(double hz, double ref_hz) {
  if (hz <= 0.0 || ref_hz <= 0.0) return 0.0;
  return kA4Midi + 12.0 * std::log2(hz / ref_hz);
}

double midi_to_hz(double midi, double ref_hz) {
  return ref_hz * std::pow(2.0, (midi - kA4Midi) / 12.0);
}

long round_half_away(double value) { return std::lround(value); }

int midi_to_pitch_class(double midi) {
  long rounded = round_half_away(midi);
  int pc = static_cast<int>(rounded % kNumPitchClasses);
  if (pc < 0) {
    pc += kNumPitchClasses;
  }
  return pc;
}

int hz_to_pitch_class(double hz, double ref_hz) {
  if (hz <= 0.0) {
    return -1;
  }
  return midi_to_pitch_class(hz_to_midi(hz, ref_hz));
}

double bin_to_hz(int bin, int sr, int n_fft) {
  return static_cast<double>(bin) * static_cast<double>(sr) / static_cast<double>(n_fft);
}

}  // namespace chordlive
