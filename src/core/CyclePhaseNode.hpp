#pragma once

#include "Node.hpp"
#include <cmath>

// Ramp 0..1 locked to the transport: fractional part of (cycle position * rate).
// Stateless; its output follows the block's cycle span.
class CyclePhaseNode final : public Node {
public:
  explicit CyclePhaseNode(Signal rate) : Node({std::move(rate)}) {}

  const char* name() const override { return "cyclephase"; }
  void prepare(double, uint32_t) override {}
  void reset() override {}

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    const double step = (ctx.frames > 0) ? (ctx.cycleEnd - ctx.cycleBegin) / ctx.frames : 0.0;
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      const double x = (ctx.cycleBegin + step * i) * static_cast<double>(finiteOr(in[0][i], 1.0f));
      out[i] = static_cast<float>(x - std::floor(x));
    }
  }
};
