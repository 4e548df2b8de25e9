#pragma once

#include "Node.hpp"
#include <cmath>

// Naive (non band-limited) oscillator with a per-sample frequency input.
class OscillatorNode final : public Node {
public:
  enum class Wave { Sine, Saw, Square, Triangle };

  OscillatorNode(Signal freq, Wave wave = Wave::Sine, float phase01 = 0.0f)
  : Node({std::move(freq)}), wave_(wave), startPhase_(wrap01(phase01)), phase_(startPhase_) {}

  const char* name() const override { return "osc"; }
  void prepare(double sampleRate, uint32_t /*maxBlock*/) override {
    sampleRate_ = sampleRate > 0.0 ? sampleRate : 48000.0;
  }
  void reset() override { phase_ = startPhase_; }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    const float* freq = in[0];
    const double inv = 1.0 / sampleRate_;
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      out[i] = shape(phase_);
      phase_ = wrap01(phase_ + static_cast<double>(finiteOr(freq[i])) * inv);
    }
  }

  Wave wave() const { return wave_; }
  double phase() const { return phase_; }

private:
  static double wrap01(double p) {
    p -= std::floor(p);
    return (p >= 1.0) ? 0.0 : p;
  }

  float shape(double p) const {
    switch (wave_) {
      case Wave::Sine: return static_cast<float>(std::sin(2.0 * M_PI * p));
      case Wave::Saw: return static_cast<float>(2.0 * p - 1.0);
      case Wave::Square: return p < 0.5 ? 1.0f : -1.0f;
      case Wave::Triangle: return static_cast<float>(1.0 - 4.0 * std::fabs(p - 0.5));
    }
    return 0.0f;
  }

  Wave wave_;
  double startPhase_ = 0.0;
  double phase_ = 0.0;
  double sampleRate_ = 48000.0;
};
