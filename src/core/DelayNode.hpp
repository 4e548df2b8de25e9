#pragma once

#include "Node.hpp"
#include <vector>
#include <algorithm>

// Mono feedback delay with wet/dry mix. Time, feedback and mix are signal inputs read per sample.
class DelayNode final : public Node {
public:
  static constexpr float kMaxFeedback = 0.99f;

  DelayNode(Signal input, Signal timeSec, Signal feedback, Signal mix, float maxDelaySec = 2.0f)
  : Node({std::move(input), std::move(timeSec), std::move(feedback), std::move(mix)}),
    maxDelaySec_(clampDelayLine(maxDelaySec, 0.001f)) {}

  const char* name() const override { return "delay"; }
  bool providesDelay() const override { return true; }

  void prepare(double sampleRate, uint32_t /*maxBlock*/) override {
    sampleRate_ = sampleRate;
    // allocate the whole line up front; time changes never reallocate
    const size_t need = static_cast<size_t>(maxDelaySec_ * static_cast<float>(sampleRate_)) + 2u;
    if (delay_.size() != need) delay_.assign(need, 0.0f);
    writeIndex_ = 0;
  }

  void reset() override {
    std::fill(delay_.begin(), delay_.end(), 0.0f);
    writeIndex_ = 0;
  }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    const size_t delayLen = delay_.size();
    if (delayLen < 2) { std::fill(out, out + ctx.frames, 0.0f); return; }
    for (uint32_t n = 0; n < ctx.frames; ++n) {
      const float timeSec = std::clamp(finiteOr(in[1][n]), 0.0f, maxDelaySec_);
      const size_t delaySamples = std::clamp<size_t>(static_cast<size_t>(timeSec * static_cast<float>(sampleRate_) + 0.5f), 1u, delayLen - 1);
      const float fb = std::clamp(finiteOr(in[2][n]), 0.0f, kMaxFeedback);
      const float mixAmt = std::clamp(finiteOr(in[3][n]), 0.0f, 1.0f);
      const size_t readIndex = (writeIndex_ + delayLen - delaySamples) % delayLen;
      const float delayed = delay_[readIndex];
      const float input = finiteOr(in[0][n]);
      // wet/dry mix
      out[n] = input * (1.0f - mixAmt) + delayed * mixAmt;
      // write new value into delay line with feedback
      delay_[writeIndex_] = input + delayed * fb;
      writeIndex_ = (writeIndex_ + 1) % delayLen;
    }
  }

  float maxDelaySec() const { return maxDelaySec_; }

private:
  float maxDelaySec_;
  double sampleRate_ = 48000.0;
  std::vector<float> delay_{};
  size_t writeIndex_ = 0;
};
