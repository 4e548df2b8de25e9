#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <vector>
#include "../core/Graph.hpp"
#include "OfflineProgress.hpp"

// Renders a sealed graph's output as fast as possible, `block` frames per call.
inline std::vector<float> renderGraphMono(Graph& graph, uint64_t frames, uint32_t block) {
  if (!graph.isSealed()) throw std::logic_error("renderGraphMono: graph is not sealed");
  if (block == 0) throw std::invalid_argument("renderGraphMono: block must be > 0");
  std::vector<float> out(static_cast<size_t>(frames), 0.0f);
  const auto tStart = std::chrono::steady_clock::now();
  auto last = tStart;
  for (uint64_t i = 0; i < frames; ) {
    const uint32_t n = static_cast<uint32_t>(std::min<uint64_t>(block, frames - i));
    graph.render(out.data() + static_cast<size_t>(i), n);
    i += n;
    if (gOfflineProgressEnabled && gOfflineProgressMs > 0) {
      const auto now = std::chrono::steady_clock::now();
      const auto msSince = std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count();
      if (msSince >= gOfflineProgressMs) {
        const double frac = static_cast<double>(i) / static_cast<double>(frames);
        std::fprintf(stderr, "[offline] %3.0f%%  cycle %.3f\r", frac * 100.0, graph.getCyclePosition());
        last = now;
      }
    }
  }
  const auto tEnd = std::chrono::steady_clock::now();
  const double sec = std::chrono::duration<double>(tEnd - tStart).count();
  const double rtSec = static_cast<double>(frames) / graph.sampleRate();
  if (gOfflineSummaryEnabled && rtSec > 0.0 && sec > 0.0) {
    std::fprintf(stderr, "[offline] rendered %.3fs in %.3fs (speedup %.1fx)    \n", rtSec, sec, rtSec / sec);
  }
  return out;
}
