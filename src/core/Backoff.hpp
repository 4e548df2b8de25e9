#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

inline void cpuPause() {
#if defined(__x86_64__) || defined(__i386__)
  __asm__ __volatile__("pause");
#elif defined(__aarch64__) || defined(__arm__)
  __asm__ __volatile__("yield");
#else
  std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

// Bounded exponential backoff for non-realtime threads: spins first (8, 16, 32... pauses),
// then sleeps 50us, 100us, ... capped at maxSleep. Never used on the audio thread.
class Backoff {
public:
  explicit Backoff(std::chrono::microseconds maxSleep = std::chrono::microseconds(2000)) : maxSleep_(maxSleep) {}

  void wait() {
    if (step_ < kSpinSteps) {
      for (int p = 0; p < (8 << step_); ++p) cpuPause();
    } else {
      auto sleep = std::chrono::microseconds(50) * (1 << std::min(step_ - kSpinSteps, 10));
      if (sleep > maxSleep_) sleep = maxSleep_;
      std::this_thread::sleep_for(sleep);
    }
    ++step_;
  }

  int attempts() const { return step_; }

private:
  static constexpr int kSpinSteps = 4;
  std::chrono::microseconds maxSleep_;
  int step_ = 0;
};
