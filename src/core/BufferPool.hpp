#pragma once

#include <vector>
#include <cstdint>
#include <algorithm>

// Fixed-length sample buffers handed out while a graph is sealed. Returned pointers stay valid for
// the lifetime of the pool (growing the outer vector moves the inner vectors, not their storage).
// Acquire only outside the audio thread.
class BufferPool {
public:
  explicit BufferPool(uint32_t frames = 0) : frames_(frames) {}

  void setFrames(uint32_t frames) { frames_ = frames; }
  uint32_t frames() const { return frames_; }
  size_t size() const { return entries_.size(); }

  // Acquire a buffer of frames() samples, every sample set to fill.
  float* acquire(float fill = 0.0f) {
    entries_.emplace_back(static_cast<size_t>(std::max<uint32_t>(1, frames_)), fill);
    return entries_.back().data();
  }

  // Acquire a single-sample cell (feedback hold values).
  float* acquireCell(float fill = 0.0f) {
    entries_.emplace_back(1u, fill);
    return entries_.back().data();
  }

  void releaseAll() { entries_.clear(); }

private:
  std::vector<std::vector<float>> entries_{};
  uint32_t frames_ = 0;
};
