#include "LiveSession.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <stdexcept>

LiveSession::LiveSession(int transferAttempts) : transferAttempts_(std::max(0, transferAttempts)) {}

LiveSession::~LiveSession() {
  // The audio thread must be stopped before the session goes away.
  active_.store(nullptr, std::memory_order_seq_cst);
  retired_.clear();
  owned_.reset();
}

bool LiveSession::install(std::unique_ptr<Graph> graph) {
  if (!graph) throw std::invalid_argument("LiveSession::install: null graph");
  std::lock_guard<std::mutex> lock(installMutex_);
  if (!graph->isSealed()) graph->seal();

  bool exact = true;
  if (owned_) {
    exact = graph->transferSessionTiming(*owned_, transferAttempts_);
    if (!exact) {
      fallbacks_.fetch_add(1, std::memory_order_relaxed);
      if (gSessionLogEnabled) {
        std::fprintf(stderr, "[session] Warning: timing of the running graph stayed busy for %d reads; installed with best-effort offset\n",
                     transferAttempts_);
      }
    }
  }
  // A tempo request still aimed at the outgoing graph carries over unless the patch sets its own.
  const double requested = tempoCps_.load(std::memory_order_acquire);
  const uint64_t outgoing = owned_ ? owned_->generation() : 0;
  if (requested > 0.0 && tempoGeneration_.load(std::memory_order_acquire) == outgoing &&
      !graph->transport().cpsExplicit()) {
    graph->setCps(requested);
  }
  graph->setGeneration(nextGeneration_++);

  const bool replaced = static_cast<bool>(owned_);
  // nothing after the publishing store may throw
  if (replaced) retired_.reserve(retired_.size() + 1);
  active_.store(graph.get(), std::memory_order_seq_cst);
  const uint64_t mark = buffers_.load(std::memory_order_seq_cst);
  if (replaced) retired_.push_back(Retired{std::move(owned_), mark});
  owned_ = std::move(graph);
  if (replaced) swaps_.fetch_add(1, std::memory_order_release);

  if (gSessionLogEnabled) {
    std::fprintf(stderr, "[session] installed graph #%llu (%zu nodes, cps %.4f, cycle %.4f)\n",
                 static_cast<unsigned long long>(owned_->generation()), owned_->nodeCount(),
                 owned_->getCps(), owned_->getCyclePosition());
  }

  // reclaim what the audio thread has moved past
  const uint64_t done = buffers_.load(std::memory_order_seq_cst);
  retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                [done](const Retired& r) { return done > r.retiredAtBuffer; }),
                 retired_.end());
  return exact;
}

void LiveSession::setTempo(double cps) {
  if (!std::isfinite(cps) || cps <= 0.0) {
    throw std::invalid_argument("LiveSession::setTempo: cps must be finite and positive (got " + std::to_string(cps) + ")");
  }
  std::lock_guard<std::mutex> lock(installMutex_);
  tempoCps_.store(cps, std::memory_order_relaxed);
  tempoGeneration_.store(owned_ ? owned_->generation() : 0, std::memory_order_relaxed);
  tempoSerial_.fetch_add(1, std::memory_order_release);
  if (gSessionLogEnabled) std::fprintf(stderr, "[session] tempo -> %.4f cps\n", cps);
}

bool LiveSession::hush() {
  std::lock_guard<std::mutex> lock(installMutex_);
  if (!owned_ || !active_.load(std::memory_order_seq_cst)) return false;
  // owned_ stays alive until the next install retires it through the usual buffer mark
  active_.store(nullptr, std::memory_order_seq_cst);
  if (gSessionLogEnabled) {
    std::fprintf(stderr, "[session] hushed graph #%llu at cycle %.4f\n",
                 static_cast<unsigned long long>(owned_->generation()), owned_->getCyclePosition());
  }
  return true;
}

void LiveSession::collectRetired() {
  std::lock_guard<std::mutex> lock(installMutex_);
  const uint64_t done = buffers_.load(std::memory_order_seq_cst);
  retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                [done](const Retired& r) { return done > r.retiredAtBuffer; }),
                 retired_.end());
}

size_t LiveSession::retiredCount() const {
  std::lock_guard<std::mutex> lock(installMutex_);
  return retired_.size();
}

void LiveSession::renderNext(float* out, uint32_t frames) noexcept {
  Graph* g = active_.load(std::memory_order_seq_cst);
  if (!g) {
    std::fill(out, out + frames, 0.0f);
    buffers_.fetch_add(1, std::memory_order_seq_cst);
    return;
  }
  if (g->generation() != lastGeneration_) {
    // First graph lends its clock to the session; later graphs continue the session's clock.
    if (lastGeneration_ == 0) samples_.store(g->transport().samplesRendered(), std::memory_order_relaxed);
    else if (g->transport().mode() == ClockMode::SampleClock) g->transport().syncSampleClock(samples_.load(std::memory_order_relaxed));
    lastGeneration_ = g->generation();
  }
  const uint64_t serial = tempoSerial_.load(std::memory_order_acquire);
  if (serial != appliedTempoSerial_) {
    appliedTempoSerial_ = serial;
    // setTempo validated the value, so setCps cannot throw here
    if (tempoGeneration_.load(std::memory_order_relaxed) == g->generation()) g->setCps(tempoCps_.load(std::memory_order_relaxed));
  }
  g->render(out, frames);
  samples_.fetch_add(frames, std::memory_order_relaxed);
  cps_.store(g->getCps(), std::memory_order_release);
  position_.store(g->getCyclePosition(), std::memory_order_release);
  buffers_.fetch_add(1, std::memory_order_seq_cst);
}
