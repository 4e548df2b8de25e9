#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>
#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#include <sched.h>
#endif
#include "../session/LiveSession.hpp"

// Best effort; the render thread keeps normal priority when this fails.
inline bool trySetRealtimePriority(std::thread& t) noexcept {
#if defined(__linux__)
  sched_param param{};
  param.sched_priority = sched_get_priority_max(SCHED_FIFO);
  if (param.sched_priority > 0 && pthread_setschedparam(t.native_handle(), SCHED_FIFO, &param) == 0) return true;
  param.sched_priority = sched_get_priority_min(SCHED_FIFO);
  return pthread_setschedparam(t.native_handle(), SCHED_FIFO, &param) == 0;
#elif defined(__APPLE__)
  sched_param param{};
  param.sched_priority = sched_get_priority_max(SCHED_OTHER);
  return pthread_setschedparam(t.native_handle(), SCHED_OTHER, &param) == 0;
#else
  (void)t;
  return false;
#endif
}

// Drives a LiveSession from a dedicated thread paced by the wall clock, one buffer per period,
// the way a device callback would. Each rendered buffer is handed to the sink on the render thread.
class RealtimeGraphRenderer {
public:
  using Sink = std::function<void(const float* samples, uint32_t frames)>;

  RealtimeGraphRenderer() = default;
  ~RealtimeGraphRenderer() { stop(); }

  RealtimeGraphRenderer(const RealtimeGraphRenderer&) = delete;
  RealtimeGraphRenderer& operator=(const RealtimeGraphRenderer&) = delete;

  void setSink(Sink sink) {
    if (running_.load(std::memory_order_acquire)) throw std::logic_error("RealtimeGraphRenderer: setSink while running");
    sink_ = std::move(sink);
  }

  void start(LiveSession& session, double sampleRate, uint32_t bufferFrames) {
    if (running_.load(std::memory_order_acquire)) throw std::logic_error("RealtimeGraphRenderer already running");
    if (!(sampleRate > 0.0)) throw std::invalid_argument("sampleRate must be > 0");
    if (bufferFrames == 0) throw std::invalid_argument("bufferFrames must be > 0");
    session_ = &session;
    sampleRate_ = sampleRate;
    frames_ = bufferFrames;
    buffer_.assign(bufferFrames, 0.0f);
    buffers_.store(0, std::memory_order_relaxed);
    late_.store(0, std::memory_order_relaxed);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this] { run(); });
    if (!trySetRealtimePriority(thread_)) {
      std::fprintf(stderr, "[realtime] realtime priority unavailable; running at normal priority\n");
    }
  }

  void stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
  }

  bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }
  uint64_t buffersRendered() const noexcept { return buffers_.load(std::memory_order_relaxed); }
  // Buffers that finished more than one period past their deadline.
  uint64_t lateBuffers() const noexcept { return late_.load(std::memory_order_relaxed); }
  double sampleRate() const noexcept { return sampleRate_; }

private:
  void run() noexcept {
    using Clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(static_cast<double>(frames_) / sampleRate_));
    auto deadline = Clock::now();
    while (running_.load(std::memory_order_acquire)) {
      session_->renderNext(buffer_.data(), frames_);
      if (sink_) sink_(buffer_.data(), frames_);
      buffers_.fetch_add(1, std::memory_order_relaxed);
      deadline += period;
      const auto now = Clock::now();
      if (now > deadline + period) {
        // overrun: count it and re-anchor instead of bursting to catch up
        late_.fetch_add(1, std::memory_order_relaxed);
        deadline = now;
        continue;
      }
      std::this_thread::sleep_until(deadline);
    }
  }

  LiveSession* session_ = nullptr;
  Sink sink_;
  double sampleRate_ = 48000.0;
  uint32_t frames_ = 512;
  std::vector<float> buffer_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> buffers_{0};
  std::atomic<uint64_t> late_{0};
};
