/// @file ring_buffer.cpp
/// @brief Implementation of the thread-safe circular sample store.

#include "core/ring_buffer.h"

#include <algorithm>

#include "util/exception.h"

namespace chordlive {

namespace {

size_t capacity_for(int sample_rate, float seconds) {
  CHORDLIVE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                      "Ring buffer sample rate must be positive");
  CHORDLIVE_CHECK_MSG(seconds > 0.0f, ErrorCode::InvalidParameter,
                      "Ring buffer length must be positive");
  return static_cast<size_t>(static_cast<double>(sample_rate) * static_cast<double>(seconds));
}

}  // namespace

RingBuffer::RingBuffer(int sample_rate, float seconds)
    : RingBuffer(capacity_for(sample_rate, seconds)) {}

RingBuffer::RingBuffer(size_t capacity) {
  CHORDLIVE_CHECK_MSG(capacity > 0, ErrorCode::InvalidParameter,
                      "Ring buffer capacity must be positive");
  buffer_.assign(capacity, 0.0f);
}

void RingBuffer::push(const float* samples, size_t n_samples) {
  if (samples == nullptr || n_samples == 0) {
    return;
  }

  const size_t size = buffer_.size();

  // Only the tail of an oversized block can survive
  const float* src = samples;
  size_t n = n_samples;
  size_t skipped = 0;
  if (n > size) {
    skipped = n - size;
    src += skipped;
    n = size;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  // Cursor as if the skipped samples had been written too
  size_t idx = (write_idx_ + skipped) % size;
  size_t end = idx + n;

  if (end <= size) {
    std::copy(src, src + n, buffer_.begin() + idx);
  } else {
    size_t first = size - idx;
    std::copy(src, src + first, buffer_.begin() + idx);
    std::copy(src + first, src + n, buffer_.begin());
  }

  if (write_idx_ + n_samples >= size) {
    filled_ = true;
  }
  write_idx_ = end % size;
  total_written_ += n_samples;
}

std::vector<float> RingBuffer::read_last(size_t n) const {
  const size_t size = buffer_.size();
  n = std::min(n, size);

  std::lock_guard<std::mutex> lock(mutex_);

  if (!filled_ && write_idx_ < n) {
    return std::vector<float>(buffer_.begin(), buffer_.begin() + write_idx_);
  }

  std::vector<float> out;
  out.reserve(n);
  size_t start = (write_idx_ + size - n) % size;
  if (start < write_idx_) {
    out.insert(out.end(), buffer_.begin() + start, buffer_.begin() + write_idx_);
  } else if (n > 0) {
    out.insert(out.end(), buffer_.begin() + start, buffer_.end());
    out.insert(out.end(), buffer_.begin(), buffer_.begin() + write_idx_);
  }
  return out;
}

size_t RingBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return filled_ ? buffer_.size() : write_idx_;
}

bool RingBuffer::filled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return filled_;
}

uint64_t RingBuffer::total_written() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_written_;
}

void RingBuffer::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::fill(buffer_.begin(), buffer_.end(), 0.0f);
  write_idx_ = 0;
  filled_ = false;
  total_written_ = 0;
}

}  // namespace chordlive
