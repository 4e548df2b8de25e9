#pragma once

#include "Node.hpp"
#include <random>

// White noise scaled by `amp`. A fixed seed makes the sequence reproducible across renders and
// across reset().
class NoiseNode final : public Node {
public:
  explicit NoiseNode(Signal amp, uint32_t seed = 1u)
  : Node({std::move(amp)}), seed_(seed), rng_(seed) {}

  const char* name() const override { return "noise"; }
  void prepare(double, uint32_t) override {}
  void reset() override { rng_.seed(seed_); }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    const float* amp = in[0];
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      // Raw engine output keeps the sequence identical across standard libraries.
      const float u = static_cast<float>(rng_() >> 8) * (1.0f / 8388608.0f) - 1.0f;
      out[i] = u * finiteOr(amp[i]);
    }
  }

  uint32_t seed() const { return seed_; }

private:
  uint32_t seed_;
  std::mt19937 rng_;
};
