#pragma once

#include "Node.hpp"
#include <algorithm>

// Linear ramp from `start` to `end` over `duration` seconds, restarted on each rising edge of
// `trigger` (crossing 0.5). Holds the end value once the ramp completes.
class LineNode final : public Node {
public:
  LineNode(Signal start, Signal end, Signal duration, Signal trigger)
  : Node({std::move(start), std::move(end), std::move(duration), std::move(trigger)}) {}

  const char* name() const override { return "line"; }
  void prepare(double sampleRate, uint32_t /*maxBlock*/) override {
    sampleRate_ = sampleRate > 0.0 ? sampleRate : 48000.0;
  }
  void reset() override { value_ = 0.0f; elapsed_ = 0.0; active_ = false; lastTrigger_ = 0.0f; }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    const double dt = 1.0 / sampleRate_;
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      const float start = finiteOr(in[0][i]);
      const float end = finiteOr(in[1][i]);
      const double duration = std::max(0.001f, finiteOr(in[2][i], 0.001f));
      const float trig = finiteOr(in[3][i]);
      if (trig > 0.5f && lastTrigger_ <= 0.5f) { value_ = start; elapsed_ = 0.0; active_ = true; }
      lastTrigger_ = trig;
      if (active_) {
        const double t = elapsed_ / duration;
        if (t >= 1.0) { value_ = end; active_ = false; }
        else value_ = static_cast<float>(start + (end - start) * t);
        elapsed_ += dt;
      }
      out[i] = value_;
    }
  }

  bool isActive() const { return active_; }

private:
  double sampleRate_ = 48000.0;
  float value_ = 0.0f;
  double elapsed_ = 0.0;
  bool active_ = false;
  float lastTrigger_ = 0.0f;
};
