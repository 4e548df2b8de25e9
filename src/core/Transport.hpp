#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "Node.hpp"

enum class ClockMode : uint8_t { SampleClock, WallClock };

// Consistent copy of a Transport's timing fields.
struct TimingSnapshot {
  double cps = 0.5;
  ClockMode mode = ClockMode::SampleClock;
  std::chrono::steady_clock::time_point anchor{};
  uint64_t samples = 0;
  double offset = 0.0;
  double sampleRate = 48000.0;
  double cachedPosition = 0.0;
};

// Maps elapsed time to cycle position: position = elapsed * cps + offset.
// Elapsed time is samples / sampleRate in sample-clock mode and (now - anchor) in wall-clock mode.
//
// Fields are published through a sequence counter so any thread can take a consistent snapshot
// without locking. There is a single writer at a time: the audio thread while the owning graph
// is live, otherwise whoever owns the graph.
class Transport {
public:
  using Clock = std::chrono::steady_clock;

  explicit Transport(double sampleRate = 48000.0, double cps = 0.5)
  : sampleRate_(sampleRate > 0.0 ? sampleRate : 48000.0) {
    validateCps(cps);
    cps_.store(cps, std::memory_order_relaxed);
    anchorTicks_.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
  }

  double sampleRate() const { return sampleRate_; }
  double cps() const { return cps_.load(std::memory_order_acquire); }
  ClockMode mode() const { return static_cast<ClockMode>(mode_.load(std::memory_order_acquire)); }
  uint64_t samplesRendered() const { return samples_.load(std::memory_order_acquire); }
  // Cached position, refreshed after every rendered buffer.
  double cyclePosition() const { return cached_.load(std::memory_order_acquire); }
  // True once a tempo was set explicitly (patch or setCps); otherwise a transfer inherits the old tempo.
  bool cpsExplicit() const { return cpsExplicit_; }

  // Tempo change keeps the position continuous by re-deriving the offset at the current instant.
  void setCps(double cps) {
    validateCps(cps);
    const auto now = Clock::now();
    beginWrite();
    const double pos = positionAtUnlocked(now);
    const double el = elapsedUnlocked(now);
    cps_.store(cps, std::memory_order_relaxed);
    offset_.store(pos - el * cps, std::memory_order_relaxed);
    endWrite();
    cpsExplicit_ = true;
  }

  // Switches to wall-clock timing without moving the current position.
  void enableWallClock() {
    if (mode() == ClockMode::WallClock) return;
    const auto now = Clock::now();
    beginWrite();
    const double pos = positionAtUnlocked(now);
    mode_.store(static_cast<uint8_t>(ClockMode::WallClock), std::memory_order_relaxed);
    anchorTicks_.store(now.time_since_epoch().count(), std::memory_order_relaxed);
    offset_.store(pos, std::memory_order_relaxed);
    cached_.store(pos, std::memory_order_relaxed);
    endWrite();
  }

  // Audio thread: context for the next block of `frames` samples.
  ProcessContext beginBlock(uint32_t frames) const {
    ProcessContext ctx;
    ctx.sampleRate = sampleRate_;
    ctx.frames = frames;
    ctx.blockStart = samples_.load(std::memory_order_relaxed);
    ctx.cps = cps_.load(std::memory_order_relaxed);
    ctx.cycleBegin = positionAtUnlocked(Clock::now());
    ctx.cycleEnd = ctx.cycleBegin + static_cast<double>(frames) / sampleRate_ * ctx.cps;
    return ctx;
  }

  // Audio thread: advance the sample clock and refresh the cached position.
  void endBlock(uint32_t frames) {
    beginWrite();
    samples_.store(samples_.load(std::memory_order_relaxed) + frames, std::memory_order_relaxed);
    cached_.store(positionAtUnlocked(Clock::now()), std::memory_order_relaxed);
    endWrite();
  }

  // Non-blocking read; false while a writer is mid-update.
  bool trySnapshot(TimingSnapshot& out) const {
    const uint64_t s1 = seq_.load(std::memory_order_acquire);
    if (s1 & 1u) return false;
    out.cps = cps_.load(std::memory_order_relaxed);
    out.mode = static_cast<ClockMode>(mode_.load(std::memory_order_relaxed));
    out.anchor = Clock::time_point(Clock::duration(anchorTicks_.load(std::memory_order_relaxed)));
    out.samples = samples_.load(std::memory_order_relaxed);
    out.offset = offset_.load(std::memory_order_relaxed);
    out.cachedPosition = cached_.load(std::memory_order_relaxed);
    out.sampleRate = sampleRate_;
    std::atomic_thread_fence(std::memory_order_acquire);
    return seq_.load(std::memory_order_relaxed) == s1;
  }

  // Hot-swap transfer. Anchor, mode and sample clock are copied from the old timing; the offset is
  // old_position - elapsed * new_cps with both terms evaluated against the copied anchor at `now`.
  void adoptTiming(const TimingSnapshot& old, Clock::time_point now) {
    const double oldElapsed = elapsedOf(old, now);
    const double oldPos = oldElapsed * old.cps + old.offset;
    const double newCps = cpsExplicit_ ? cps_.load(std::memory_order_relaxed) : old.cps;
    const uint64_t samples = (old.sampleRate == sampleRate_)
      ? old.samples
      : static_cast<uint64_t>(std::llround(static_cast<double>(old.samples) * sampleRate_ / old.sampleRate));
    const double newElapsed = (old.mode == ClockMode::WallClock) ? oldElapsed : static_cast<double>(samples) / sampleRate_;
    beginWrite();
    cps_.store(newCps, std::memory_order_relaxed);
    mode_.store(static_cast<uint8_t>(old.mode), std::memory_order_relaxed);
    anchorTicks_.store(old.anchor.time_since_epoch().count(), std::memory_order_relaxed);
    samples_.store(samples, std::memory_order_relaxed);
    offset_.store(oldPos - newElapsed * newCps, std::memory_order_relaxed);
    cached_.store(oldPos, std::memory_order_relaxed);
    endWrite();
  }

  // Best-effort continuation when the old timing could not be read consistently: the old cached
  // position becomes the offset against a fresh anchor.
  void adoptFallback(double position, double oldCps, ClockMode mode, uint64_t samples) {
    const double newCps = cpsExplicit_ ? cps_.load(std::memory_order_relaxed) : oldCps;
    const double el = (mode == ClockMode::WallClock) ? 0.0 : static_cast<double>(samples) / sampleRate_;
    beginWrite();
    cps_.store(newCps, std::memory_order_relaxed);
    mode_.store(static_cast<uint8_t>(mode), std::memory_order_relaxed);
    anchorTicks_.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
    samples_.store(samples, std::memory_order_relaxed);
    offset_.store(position - el * newCps, std::memory_order_relaxed);
    cached_.store(position, std::memory_order_relaxed);
    endWrite();
  }

  // Session harness: align the sample clock with the session's when the graph goes live.
  void syncSampleClock(uint64_t samples) {
    beginWrite();
    samples_.store(samples, std::memory_order_relaxed);
    endWrite();
  }

  static double elapsedOf(const TimingSnapshot& s, Clock::time_point now) {
    if (s.mode == ClockMode::WallClock) return std::chrono::duration<double>(now - s.anchor).count();
    return static_cast<double>(s.samples) / s.sampleRate;
  }
  static double positionOf(const TimingSnapshot& s, Clock::time_point now) {
    return elapsedOf(s, now) * s.cps + s.offset;
  }

private:
  static void validateCps(double cps) {
    if (!std::isfinite(cps) || cps <= 0.0) {
      throw std::invalid_argument("cps must be finite and positive (got " + std::to_string(cps) + ")");
    }
  }

  void beginWrite() {
    const uint64_t s = seq_.load(std::memory_order_relaxed);
    seq_.store(s + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);
  }
  void endWrite() {
    seq_.store(seq_.load(std::memory_order_relaxed) + 1, std::memory_order_release);
  }

  // Writer-side reads (or reads by the single writer thread).
  double elapsedUnlocked(Clock::time_point now) const {
    if (static_cast<ClockMode>(mode_.load(std::memory_order_relaxed)) == ClockMode::WallClock) {
      const auto anchor = Clock::time_point(Clock::duration(anchorTicks_.load(std::memory_order_relaxed)));
      return std::chrono::duration<double>(now - anchor).count();
    }
    return static_cast<double>(samples_.load(std::memory_order_relaxed)) / sampleRate_;
  }
  double positionAtUnlocked(Clock::time_point now) const {
    return elapsedUnlocked(now) * cps_.load(std::memory_order_relaxed) + offset_.load(std::memory_order_relaxed);
  }

  const double sampleRate_;
  bool cpsExplicit_ = false;
  std::atomic<uint64_t> seq_{0};
  std::atomic<double> cps_{0.5};
  std::atomic<uint8_t> mode_{static_cast<uint8_t>(ClockMode::SampleClock)};
  std::atomic<Clock::rep> anchorTicks_{0};
  std::atomic<uint64_t> samples_{0};
  std::atomic<double> offset_{0.0};
  std::atomic<double> cached_{0.0};
};
