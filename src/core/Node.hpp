#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <cmath>
#include "Signal.hpp"

using SampleTime = uint64_t;

struct ProcessContext {
  double sampleRate = 48000.0;
  uint32_t frames = 0;
  SampleTime blockStart = 0; // absolute sample start of this block
  double cps = 0.5;          // cycles per second in effect for this block
  double cycleBegin = 0.0;   // cycle span covered by this block: [cycleBegin, cycleEnd)
  double cycleEnd = 0.0;
};

// Leaf DSP unit. Inputs are Signals resolved by the graph into one buffer per input, in
// declaration order. All private state lives in the node and is touched only by process/reset.
class Node {
public:
  explicit Node(std::vector<Signal> inputs = {}) : inputs_(std::move(inputs)) {}
  virtual ~Node() = default;

  // Kind tag ("osc", "comb", ...)
  virtual const char* name() const = 0;
  virtual void prepare(double sampleRate, uint32_t maxBlock) = 0;
  virtual void reset() = 0;
  // inputs[k] holds ctx.frames samples for inputs()[k]; out receives ctx.frames samples.
  virtual void process(ProcessContext ctx, const float* const* inputs, float* out) = 0;
  // True when output at time t depends only on inputs strictly before t (look-back buffer).
  virtual bool providesDelay() const { return false; }

  const std::vector<Signal>& inputs() const { return inputs_; }

  // Ordered, de-duplicated node references across all inputs.
  std::vector<NodeId> inputNodeIds() const {
    std::vector<NodeId> all;
    for (const auto& s : inputs_) s.collectNodeIds(all);
    std::vector<NodeId> out;
    out.reserve(all.size());
    for (NodeId id : all) {
      if (std::find(out.begin(), out.end(), id) == out.end()) out.push_back(id);
    }
    return out;
  }

protected:
  std::vector<Signal> inputs_;
};

// Leaf nodes clamp parameter inputs instead of failing; non-finite values read as 0.
inline float finiteOr(float v, float fallback = 0.0f) {
  return std::isfinite(v) ? v : fallback;
}

// Upper bound on look-back storage per delay line (seconds). Non-finite requests get the bound.
inline constexpr float kMaxDelayLineSec = 60.0f;
inline float clampDelayLine(float sec, float minSec) {
  return std::clamp(finiteOr(sec, kMaxDelayLineSec), minSec, kMaxDelayLineSec);
}

// Observability helper: peak/RMS of a mono buffer segment.
inline void measurePeakRms(const float* samples, uint32_t frames, double& outPeak, double& outRms) {
  double peak = 0.0; long double sumSq = 0.0L;
  for (uint32_t i = 0; i < frames; ++i) { const double s = samples[i]; const double a = std::fabs(s); if (a > peak) peak = a; sumSq += s * s; }
  outPeak = peak; outRms = (frames > 0) ? std::sqrt(static_cast<double>(sumSq / static_cast<long double>(frames))) : 0.0;
}
