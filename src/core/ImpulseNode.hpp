#pragma once

#include "Node.hpp"
#include <algorithm>
#include <cmath>

// Single-sample 1.0 spikes. Periodic mode fires on each phase wrap of `freq`; one-shot mode
// fires once on the first sample after construction or reset.
class ImpulseNode final : public Node {
public:
  explicit ImpulseNode(Signal freq, bool oneShot = false)
  : Node({std::move(freq)}), oneShot_(oneShot) {}

  const char* name() const override { return "impulse"; }
  void prepare(double sampleRate, uint32_t /*maxBlock*/) override {
    sampleRate_ = sampleRate > 0.0 ? sampleRate : 48000.0;
  }
  void reset() override { phase_ = 0.0; fired_ = false; }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    if (oneShot_) {
      for (uint32_t i = 0; i < ctx.frames; ++i) {
        out[i] = fired_ ? 0.0f : 1.0f;
        fired_ = true;
      }
      return;
    }
    const float* freq = in[0];
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      phase_ += std::max(0.0f, finiteOr(freq[i])) / sampleRate_;
      if (phase_ >= 1.0) {
        out[i] = 1.0f;
        phase_ -= std::floor(phase_);
      } else {
        out[i] = 0.0f;
      }
    }
  }

private:
  bool oneShot_ = false;
  bool fired_ = false;
  double phase_ = 0.0;
  double sampleRate_ = 48000.0;
};
