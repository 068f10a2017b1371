#pragma once

/// @file convert.h
/// @brief Frequency and pitch conversion functions.

namespace chordlive {

/// @brief Reference frequency of A4 in Hz.
constexpr double kA4Hz = 440.0;

/// @brief MIDI note number of A4.
constexpr double kA4Midi = 69.0;

/// @brief Converts Hz to a continuous MIDI-style pitch number.
/// @param hz Frequency in Hz (must be positive)
/// @param ref_hz Frequency of A4 (pitch 69)
/// @return 69 + 12 * log2(hz / ref_hz), or 0 if hz <= 0
double hz_to_midi(double hz, double ref_hz = kA4Hz);

/// @brief Converts a continuous pitch number to Hz.
/// @param midi Pitch number (A4 = 69)
/// @param ref_hz Frequency of A4
/// @return Frequency in Hz
double midi_to_hz(double midi, double ref_hz = kA4Hz);

/// @brief Rounds to the nearest integer, halves away from zero.
/// @details 60.5 -> 61, -60.5 -> -61. This is the rounding policy for every
///          pitch-to-pitch-class mapping in the library.
long round_half_away(double value);

/// @brief Maps a continuous pitch number to a pitch class.
/// @param midi Pitch number
/// @return Pitch class in [0, 12) after rounding half away from zero
int midi_to_pitch_class(double midi);

/// @brief Maps a frequency to a pitch class.
/// @param hz Frequency in Hz
/// @param ref_hz Frequency of A4
/// @return Pitch class (0=C, 1=C#, ..., 11=B), or -1 if hz <= 0
int hz_to_pitch_class(double hz, double ref_hz = kA4Hz);

/// @brief Converts FFT bin index to Hz.
/// @param bin Bin index
/// @param sr Sample rate
/// @param n_fft FFT size
/// @return Center frequency of the bin in Hz
double bin_to_hz(int bin, int sr, int n_fft);

}  // namespace chordlive
