#pragma once

#include "Node.hpp"
#include <algorithm>
#include <cmath>

// RBJ cookbook biquad (transposed direct form II) with signal-rate cutoff and Q.
// Q is clamped to [0.01, 20] and cutoff to [10 Hz, 0.49 * sampleRate].
class BiquadNode final : public Node {
public:
  enum class Mode { LowPass, HighPass, BandPass };

  BiquadNode(Mode mode, Signal input, Signal cutoff, Signal q)
  : Node({std::move(input), std::move(cutoff), std::move(q)}), mode_(mode) {}

  const char* name() const override {
    switch (mode_) {
      case Mode::LowPass: return "lowpass";
      case Mode::HighPass: return "highpass";
      case Mode::BandPass: return "bandpass";
    }
    return "biquad";
  }

  void prepare(double sampleRate, uint32_t /*maxBlock*/) override {
    sampleRate_ = sampleRate > 0.0 ? sampleRate : 48000.0;
    lastCutoff_ = -1.0f;
  }
  void reset() override { z1_ = z2_ = 0.0; lastCutoff_ = -1.0f; }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    const float nyqLimit = static_cast<float>(0.49 * sampleRate_);
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      const float cutoff = std::clamp(finiteOr(in[1][i], 1000.0f), 10.0f, nyqLimit);
      const float q = std::clamp(finiteOr(in[2][i], 0.707f), 0.01f, 20.0f);
      if (std::fabs(cutoff - lastCutoff_) > 0.1f || std::fabs(q - lastQ_) > 0.001f) updateCoefs(cutoff, q);
      const double x = finiteOr(in[0][i]);
      const double y = b0_ * x + z1_;
      z1_ = b1_ * x - a1_ * y + z2_;
      z2_ = b2_ * x - a2_ * y;
      out[i] = static_cast<float>(y);
    }
  }

  Mode mode() const { return mode_; }

private:
  void updateCoefs(float cutoff, float q) {
    lastCutoff_ = cutoff; lastQ_ = q;
    const double w0 = 2.0 * M_PI * cutoff / sampleRate_;
    const double cw = std::cos(w0), sw = std::sin(w0);
    const double alpha = sw / (2.0 * q);
    double b0 = 0.0, b1 = 0.0, b2 = 0.0;
    switch (mode_) {
      case Mode::LowPass: b0 = (1.0 - cw) * 0.5; b1 = 1.0 - cw; b2 = b0; break;
      case Mode::HighPass: b0 = (1.0 + cw) * 0.5; b1 = -(1.0 + cw); b2 = b0; break;
      case Mode::BandPass: b0 = alpha; b1 = 0.0; b2 = -alpha; break;
    }
    const double a0 = 1.0 + alpha;
    b0_ = b0 / a0; b1_ = b1 / a0; b2_ = b2 / a0;
    a1_ = (-2.0 * cw) / a0; a2_ = (1.0 - alpha) / a0;
  }

  Mode mode_;
  double sampleRate_ = 48000.0;
  float lastCutoff_ = -1.0f;
  float lastQ_ = 0.707f;
  double b0_ = 1.0, b1_ = 0.0, b2_ = 0.0, a1_ = 0.0, a2_ = 0.0;
  double z1_ = 0.0, z2_ = 0.0;
};
