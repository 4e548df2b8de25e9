#pragma once

#include "Node.hpp"
#include <vector>
#include <algorithm>

// Feedback comb: y[n] = x[n] + feedback * y[n - D]. Backed by a look-back buffer, so it can
// close a feedback loop in the graph.
class CombFilterNode final : public Node {
public:
  static constexpr float kMinDelaySec = 0.0001f;
  static constexpr float kMaxFeedback = 0.99f;

  CombFilterNode(Signal input, Signal delaySec, Signal feedback, float maxDelaySec = 1.0f)
  : Node({std::move(input), std::move(delaySec), std::move(feedback)}),
    maxDelaySec_(clampDelayLine(maxDelaySec, kMinDelaySec)) {}

  const char* name() const override { return "comb"; }
  bool providesDelay() const override { return true; }

  void prepare(double sampleRate, uint32_t /*maxBlock*/) override {
    sampleRate_ = sampleRate > 0.0 ? sampleRate : 48000.0;
    const size_t len = static_cast<size_t>(maxDelaySec_ * sampleRate_) + 2u;
    buffer_.assign(len, 0.0f);
    writeIndex_ = 0;
  }

  void reset() override {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    writeIndex_ = 0;
  }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    const size_t len = buffer_.size();
    if (len < 2) { std::fill(out, out + ctx.frames, 0.0f); return; }
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      const float delaySec = std::clamp(finiteOr(in[1][i], kMinDelaySec), kMinDelaySec, maxDelaySec_);
      const float fb = std::clamp(finiteOr(in[2][i]), -kMaxFeedback, kMaxFeedback);
      size_t d = static_cast<size_t>(delaySec * sampleRate_ + 0.5);
      d = std::clamp<size_t>(d, 1u, len - 1);
      const float delayed = buffer_[(writeIndex_ + len - d) % len];
      const float y = finiteOr(in[0][i]) + fb * delayed;
      buffer_[writeIndex_] = y;
      writeIndex_ = (writeIndex_ + 1) % len;
      out[i] = y;
    }
  }

  float maxDelaySec() const { return maxDelaySec_; }

private:
  float maxDelaySec_;
  double sampleRate_ = 48000.0;
  std::vector<float> buffer_{};
  size_t writeIndex_ = 0;
};
