#pragma once

#include <vector>
#include <string>
#include <algorithm>
#include <cmath>
#include "Node.hpp"

// Sums N inputs, each scaled by its own gain signal, then applies master gain and an optional
// tanh soft clip. Inputs are laid out as [in0..inN-1, gain0..gainN-1].
class MixerNode final : public Node {
public:
  MixerNode(std::vector<Signal> channels, std::vector<Signal> gains, float masterGain = 1.0f, bool softClip = true)
  : Node(interleaveInputs(std::move(channels), std::move(gains))),
    channelCount_(static_cast<uint32_t>(inputs_.size() / 2)), masterGain_(masterGain), softClip_(softClip) {}

  const char* name() const override { return "mix"; }
  void prepare(double, uint32_t) override {}
  void reset() override {}

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    std::fill(out, out + ctx.frames, 0.0f);
    for (uint32_t ch = 0; ch < channelCount_; ++ch) {
      const float* src = in[ch];
      const float* g = in[channelCount_ + ch];
      for (uint32_t i = 0; i < ctx.frames; ++i) out[i] += finiteOr(src[i]) * finiteOr(g[i]);
    }
    if (masterGain_ != 1.0f) {
      for (uint32_t i = 0; i < ctx.frames; ++i) out[i] *= masterGain_;
    }
    if (softClip_) {
      for (uint32_t i = 0; i < ctx.frames; ++i) out[i] = std::tanh(out[i]);
    }
  }

  uint32_t channelCount() const { return channelCount_; }
  float masterGain() const { return masterGain_; }
  bool softClip() const { return softClip_; }

private:
  // Missing gains default to 1.0.
  static std::vector<Signal> interleaveInputs(std::vector<Signal> channels, std::vector<Signal> gains) {
    gains.resize(channels.size(), Signal(1.0f));
    std::vector<Signal> all = std::move(channels);
    all.insert(all.end(), std::make_move_iterator(gains.begin()), std::make_move_iterator(gains.end()));
    return all;
  }

  uint32_t channelCount_ = 0;
  float masterGain_ = 1.0f;
  bool softClip_ = true;
};
