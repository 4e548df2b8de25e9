#pragma once

#include "Node.hpp"
#include <algorithm>
#include <cmath>

// Feed-forward compressor with an envelope follower on the sidechain input.
// Inputs: input, sidechain, thresholdDb, ratio (>= 1), attackMs, releaseMs, makeupDb.
class CompressorNode final : public Node {
public:
  CompressorNode(Signal input, Signal sidechain, Signal thresholdDb, Signal ratio,
                 Signal attackMs, Signal releaseMs, Signal makeupDb)
  : Node({std::move(input), std::move(sidechain), std::move(thresholdDb), std::move(ratio),
          std::move(attackMs), std::move(releaseMs), std::move(makeupDb)}) {}

  const char* name() const override { return "compressor"; }
  void prepare(double sampleRate, uint32_t /*maxBlock*/) override {
    sampleRate_ = sampleRate > 0.0 ? sampleRate : 48000.0;
    lastAttackMs_ = lastReleaseMs_ = -1.0f;
    env_ = 0.0f;
  }
  void reset() override { env_ = 0.0f; }

  void process(ProcessContext ctx, const float* const* in, float* out) override {
    for (uint32_t i = 0; i < ctx.frames; ++i) {
      const float thresholdDb = std::min(0.0f, finiteOr(in[2][i], -18.0f));
      const float ratio = std::max(1.0f, finiteOr(in[3][i], 1.0f));
      const float attackMs = std::max(0.1f, finiteOr(in[4][i], 10.0f));
      const float releaseMs = std::max(0.1f, finiteOr(in[5][i], 100.0f));
      const float makeupDb = std::clamp(finiteOr(in[6][i]), -48.0f, 48.0f);
      if (attackMs != lastAttackMs_ || releaseMs != lastReleaseMs_) updateCoefs(attackMs, releaseMs);

      // envelope follower
      const float target = std::fabs(finiteOr(in[1][i]));
      const float coef = (target > env_) ? attackCoef_ : releaseCoef_;
      env_ = target + coef * (env_ - target);
      // static curve
      float gain = 1.0f;
      const float thrLin = std::pow(10.0f, thresholdDb / 20.0f);
      if (env_ > thrLin && ratio > 1.0f) {
        const float envDb = 20.0f * std::log10(std::max(env_, 1e-8f));
        const float over = envDb - thresholdDb;
        const float grDb = -over * (1.0f - 1.0f / ratio);
        gain = std::pow(10.0f, grDb / 20.0f);
      }
      gain *= std::pow(10.0f, makeupDb / 20.0f);
      gainReduction_ = gain;
      out[i] = finiteOr(in[0][i]) * gain;
    }
  }

  float envelope() const { return env_; }
  float lastGain() const { return gainReduction_; }

private:
  void updateCoefs(float attackMs, float releaseMs) {
    lastAttackMs_ = attackMs; lastReleaseMs_ = releaseMs;
    const float attT = std::max(0.0001f, attackMs / 1000.0f);
    const float relT = std::max(0.0001f, releaseMs / 1000.0f);
    attackCoef_ = std::exp(-1.0f / static_cast<float>(sampleRate_ * attT));
    releaseCoef_ = std::exp(-1.0f / static_cast<float>(sampleRate_ * relT));
  }

  double sampleRate_ = 48000.0;
  float env_ = 0.0f;
  float gainReduction_ = 1.0f;
  float attackCoef_ = 0.0f;
  float releaseCoef_ = 0.0f;
  float lastAttackMs_ = -1.0f;
  float lastReleaseMs_ = -1.0f;
};
