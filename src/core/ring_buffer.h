#pragma once

/// @file ring_buffer.h
/// @brief Thread-safe circular sample store.

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace chordlive {

/// @brief Fixed-capacity circular buffer of mono samples.
/// @details Decouples the capture cadence from the analysis cadence.
///
/// Thread Safety:
/// - push() and read_last() may be called concurrently from different threads.
/// - A single mutex is held for the whole of each write, so a write that wraps
///   around the end is observed by readers either entirely or not at all.
/// - Readers only copy under the lock; no computation happens while it is held.
class RingBuffer {
 public:
  /// @brief Constructs a buffer holding sample_rate * seconds samples.
  /// @param sample_rate Sample rate in Hz
  /// @param seconds Buffer length in seconds
  /// @throws ChordliveException if the resulting capacity is zero
  RingBuffer(int sample_rate, float seconds);

  /// @brief Constructs a buffer with an explicit capacity.
  /// @param capacity Number of samples
  /// @throws ChordliveException if capacity is zero
  explicit RingBuffer(size_t capacity);

  RingBuffer(const RingBuffer&) = delete;
  RingBuffer& operator=(const RingBuffer&) = delete;

  /// @brief Appends samples, wrapping around the buffer end.
  /// @param samples Pointer to samples
  /// @param n_samples Number of samples (0 is a no-op)
  /// @details A block longer than the capacity leaves only its last
  ///          capacity() samples in the buffer.
  void push(const float* samples, size_t n_samples);

  /// @brief Appends a vector of samples.
  void push(const std::vector<float>& samples) { push(samples.data(), samples.size()); }

  /// @brief Returns the most recent samples, oldest first.
  /// @param n Number of samples requested (clamped to capacity)
  /// @return Copy of up to n samples; shorter than n if fewer were ever written
  std::vector<float> read_last(size_t n) const;

  /// @brief Returns buffer capacity in samples.
  size_t capacity() const { return buffer_.size(); }

  /// @brief Returns number of samples currently readable.
  size_t size() const;

  /// @brief Returns true once the buffer has been completely written at least once.
  bool filled() const;

  /// @brief Returns the total number of samples ever pushed.
  uint64_t total_written() const;

  /// @brief Discards all samples and resets the write cursor.
  void clear();

 private:
  mutable std::mutex mutex_;
  std::vector<float> buffer_;
  size_t write_idx_ = 0;
  bool filled_ = false;
  uint64_t total_written_ = 0;
};

}  // namespace chordlive
