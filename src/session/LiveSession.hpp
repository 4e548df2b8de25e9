#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "../core/Graph.hpp"

// Global inline control for session diagnostics (compiler thread only)
inline bool gSessionLogEnabled = true;

// Hot-swap harness between one compiler/editor thread and one realtime audio thread.
//
// The audio thread reads the active graph pointer once per buffer, plus the latest tempo request.
// Both pointer accesses and the buffer counter are sequentially consistent, so a retired graph's
// mark orders against the audio thread's next pointer load. install() publishes a new sealed graph with a single atomic store after transferring
// timing from the graph it replaces. Replaced graphs are destroyed on the compiler thread once the
// audio thread has completed a buffer that started after the swap.
class LiveSession {
public:
  explicit LiveSession(int transferAttempts = kDefaultTransferAttempts);
  ~LiveSession();

  LiveSession(const LiveSession&) = delete;
  LiveSession& operator=(const LiveSession&) = delete;

  // Compiler thread. Seals the graph if needed; a GraphBuildError propagates and the current graph
  // keeps playing. Returns false when timing had to fall back to a best-effort offset.
  bool install(std::unique_ptr<Graph> graph);

  // Compiler thread. Tempo change for the running graph, applied by the audio thread at the start of
  // its next buffer so the graph's transport keeps a single writer. A graph installed before that
  // buffer without a tempo of its own takes this one. Throws std::invalid_argument unless finite
  // and positive.
  void setTempo(double cps);

  // Compiler thread. Silences output. The hushed graph stays as the timing source for the next
  // install, which retires it; returns false if nothing was playing.
  bool hush();

  // Audio thread. Never allocates, locks or throws; writes silence until a graph is installed and
  // while hushed.
  void renderNext(float* out, uint32_t frames) noexcept;

  // Lock-free readbacks, refreshed by the audio thread after every buffer.
  double activeCps() const { return cps_.load(std::memory_order_acquire); }
  double cyclePosition() const { return position_.load(std::memory_order_acquire); }
  uint64_t samplesRendered() const { return samples_.load(std::memory_order_acquire); }
  uint64_t buffersRendered() const { return buffers_.load(std::memory_order_acquire); }

  uint64_t swapCount() const { return swaps_.load(std::memory_order_acquire); }
  uint64_t fallbackCount() const { return fallbacks_.load(std::memory_order_acquire); }
  bool hasGraph() const { return active_.load(std::memory_order_seq_cst) != nullptr; }
  // Graphs replaced but not yet destroyed.
  size_t retiredCount() const;

  // Compiler thread: destroy retired graphs the audio thread can no longer reach.
  void collectRetired();

private:
  struct Retired { std::unique_ptr<Graph> graph; uint64_t retiredAtBuffer = 0; };

  const int transferAttempts_;
  std::atomic<Graph*> active_{nullptr};

  // compiler side
  mutable std::mutex installMutex_;
  std::unique_ptr<Graph> owned_;
  std::vector<Retired> retired_;
  uint64_t nextGeneration_ = 1;

  // Latest setTempo request and the generation it was aimed at; the audio thread applies it once
  // per serial, and only to that generation.
  std::atomic<double> tempoCps_{0.0};
  std::atomic<uint64_t> tempoGeneration_{0};
  std::atomic<uint64_t> tempoSerial_{0};

  // audio side
  uint64_t lastGeneration_ = 0;
  uint64_t appliedTempoSerial_ = 0;
  std::atomic<uint64_t> buffers_{0};
  std::atomic<uint64_t> samples_{0};
  std::atomic<double> cps_{0.0};
  std::atomic<double> position_{0.0};

  std::atomic<uint64_t> swaps_{0};
  std::atomic<uint64_t> fallbacks_{0};
};
