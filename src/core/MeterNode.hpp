#pragma once

#include "Node.hpp"
#include <atomic>

// MeterNode: pass-through node that measures peak/RMS for observability.
// The audio thread stores per-block readings; readbacks are lock-free from any thread.
class MeterNode final : public Node {
public:
  explicit MeterNode(Signal input) : Node({std::move(input)}) {}

  const char* name() const override { return "meter"; }
  void prepare(double, uint32_t) override {}
  void reset() override {
    peak_.store(0.0); rms_.store(0.0); maxPeak_.store(0.0); blocks_.store(0);
  }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    std::copy(in[0], in[0] + ctx.frames, out);
    double p = 0.0, r = 0.0;
    measurePeakRms(out, ctx.frames, p, r);
    peak_.store(p, std::memory_order_relaxed);
    rms_.store(r, std::memory_order_relaxed);
    if (p > maxPeak_.load(std::memory_order_relaxed)) maxPeak_.store(p, std::memory_order_relaxed);
    blocks_.fetch_add(1, std::memory_order_release);
  }

  // Readbacks (non-RT)
  double peak() const { return peak_.load(); }
  double rms() const { return rms_.load(); }
  double maxPeak() const { return maxPeak_.load(); }
  uint64_t blocks() const { return blocks_.load(); }

private:
  std::atomic<double> peak_{0.0};
  std::atomic<double> rms_{0.0};
  std::atomic<double> maxPeak_{0.0};
  std::atomic<uint64_t> blocks_{0};
};
