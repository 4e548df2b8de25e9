// Hot swap between a compiler thread and a running audio thread

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/DelayNode.hpp"
#include "core/Graph.hpp"
#include "core/GraphErrors.hpp"
#include "core/MixerNode.hpp"
#include "core/OscillatorNode.hpp"
#include "realtime/RealtimeGraphRenderer.hpp"
#include "session/LiveSession.hpp"

namespace {

constexpr double kCps = 0.5;

static bool expect(bool cond, const char* test, const std::string& msg) {
  if (!cond) std::fprintf(stderr, "[%s] FAILED: %s\n", test, msg.c_str());
  return cond;
}

// A different patch per edit: oscillator pitch follows the edit number, some edits add an echo loop.
static std::unique_ptr<Graph> compileEdit(int edit, bool explicitCps) {
  auto g = std::make_unique<Graph>(48000.0, 256);
  const NodeId osc = g->addNode(std::make_unique<OscillatorNode>(Signal(110.0f + 5.0f * static_cast<float>(edit % 40))), "osc");
  if (edit % 3 == 0) {
    const NodeId echo = g->reserveNode("echo");
    const NodeId bus = g->addNode(std::make_unique<MixerNode>(
      std::vector<Signal>{Signal::ref(osc), Signal::ref(echo)}, std::vector<Signal>{Signal(0.5f), Signal(0.4f)}, 1.0f, true), "bus");
    g->setNode(echo, std::make_unique<DelayNode>(Signal::ref(bus), Signal(0.03f), Signal(0.5f), Signal(1.0f), 0.1f));
    g->setOutput(bus);
  } else {
    g->setOutput(osc);
  }
  if (explicitCps) g->setCps(kCps);
  g->enableWallClockTiming();
  g->seal();
  return g;
}

struct AudioObservations {
  std::atomic<uint64_t> buffers{0};
  std::atomic<uint64_t> cpsViolations{0};
  std::atomic<uint64_t> backwards{0};
  std::atomic<uint64_t> nonFinite{0};
  double lastPosition = -1.0; // render thread only
  double worstCps = kCps;     // render thread only
};

static bool testSilenceWithoutGraph() {
  LiveSession session;
  std::vector<float> buf(64, 1.0f);
  session.renderNext(buf.data(), 64);
  bool ok = expect(!session.hasGraph(), "no_graph", "fresh session has no graph");
  for (float v : buf) ok &= expect(v == 0.0f, "no_graph", "silence expected before the first install");
  return ok;
}

// Sample-clock session driven by hand: the clock is continuous across swaps.
static bool testSampleClockSwaps() {
  LiveSession session;
  std::vector<float> buf(256);
  bool ok = true;
  auto first = std::make_unique<Graph>(48000.0, 256);
  first->setOutput(first->addNode(std::make_unique<OscillatorNode>(Signal(220.0f)), "osc"));
  first->setCps(kCps);
  ok &= expect(session.install(std::move(first)), "sample_swaps", "first install seals and succeeds");
  for (int edit = 1; edit <= 30; ++edit) {
    for (int b = 0; b < 7; ++b) session.renderNext(buf.data(), 256);
    auto g = std::make_unique<Graph>(48000.0, 256);
    g->setOutput(g->addNode(std::make_unique<OscillatorNode>(Signal(220.0f + edit)), "osc"));
    ok &= expect(session.install(std::move(g)), "sample_swaps", "transfer fell back while idle");
  }
  session.renderNext(buf.data(), 256);
  ok &= expect(session.samplesRendered() == 30ull * 7 * 256 + 256, "sample_swaps",
               "session sample count " + std::to_string(session.samplesRendered()));
  const double expected = static_cast<double>(session.samplesRendered()) / 48000.0 * kCps;
  ok &= expect(std::fabs(session.cyclePosition() - expected) < 1e-9, "sample_swaps",
               "position " + std::to_string(session.cyclePosition()) + " expected " + std::to_string(expected));
  ok &= expect(session.swapCount() == 30, "sample_swaps", "swap count");
  session.collectRetired();
  ok &= expect(session.retiredCount() == 0, "sample_swaps", "retired graphs are freed once the audio side moved on");
  return ok;
}

static bool testBadEditKeepsGraph() {
  LiveSession session;
  session.install(compileEdit(1, true));
  std::vector<float> buf(256);
  for (int b = 0; b < 4; ++b) session.renderNext(buf.data(), 256);
  const double before = session.cyclePosition();

  auto bad = std::make_unique<Graph>(48000.0, 256);
  const NodeId a = bad->reserveNode("a");
  bad->setNode(a, std::make_unique<OscillatorNode>(Signal::ref(a) + 100.0f));
  bad->setOutput(a);
  bool rejected = false;
  try {
    session.install(std::move(bad));
  } catch (const GraphBuildError& e) {
    rejected = e.kind() == GraphBuildError::Kind::FeedbackWithoutDelay;
  }
  bool ok = expect(rejected, "bad_edit", "unsealable graph must be rejected");
  ok &= expect(session.hasGraph() && session.swapCount() == 0, "bad_edit", "previous graph stays installed");
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  session.renderNext(buf.data(), 256);
  ok &= expect(session.cyclePosition() > before, "bad_edit", "playback continues");
  double peak = 0.0;
  for (float v : buf) peak = std::max(peak, static_cast<double>(std::fabs(v)));
  ok &= expect(peak > 0.1, "bad_edit", "old graph still audible");
  return ok;
}

// 500 swaps against a running audio thread at fixed tempo.
static bool testConcurrentSwaps() {
  LiveSession session;
  session.install(compileEdit(0, true));

  AudioObservations obs;
  RealtimeGraphRenderer renderer;
  renderer.setSink([&session, &obs](const float* s, uint32_t n) {
    const double cps = session.activeCps();
    if (std::fabs(cps - kCps) > 0.01) {
      obs.cpsViolations.fetch_add(1, std::memory_order_relaxed);
      obs.worstCps = cps;
    }
    const double p = session.cyclePosition();
    if (p + 1e-9 < obs.lastPosition) obs.backwards.fetch_add(1, std::memory_order_relaxed);
    obs.lastPosition = p;
    for (uint32_t i = 0; i < n; ++i) {
      if (!std::isfinite(s[i])) { obs.nonFinite.fetch_add(1, std::memory_order_relaxed); break; }
    }
    obs.buffers.fetch_add(1, std::memory_order_relaxed);
  });
  renderer.start(session, 48000.0, 256);

  static const int kDelaysMs[] = {1, 2, 5, 10, 20, 50, 100};
  std::mt19937 rng(2024);
  std::uniform_int_distribution<int> pick(0, 6);
  bool ok = true;
  for (int edit = 1; edit <= 500; ++edit) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kDelaysMs[pick(rng)]));
    session.install(compileEdit(edit, edit % 2 == 0));
    const double cps = session.activeCps();
    if (std::fabs(cps - kCps) > 0.01) {
      ok = expect(false, "concurrent_swaps", "cps " + std::to_string(cps) + " after swap " + std::to_string(edit));
      break;
    }
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  renderer.stop();

  ok &= expect(session.swapCount() == 500 || !ok, "concurrent_swaps", "every edit was installed");
  ok &= expect(obs.buffers.load() > 100, "concurrent_swaps", "audio thread rendered too few buffers");
  ok &= expect(obs.cpsViolations.load() == 0, "concurrent_swaps",
               "audio thread saw cps " + std::to_string(obs.worstCps) + " (" + std::to_string(obs.cpsViolations.load()) + " times)");
  ok &= expect(obs.backwards.load() == 0, "concurrent_swaps",
               "cycle position went backwards " + std::to_string(obs.backwards.load()) + " times");
  ok &= expect(obs.nonFinite.load() == 0, "concurrent_swaps", "non-finite audio");
  session.collectRetired();
  ok &= expect(session.retiredCount() <= 1, "concurrent_swaps", "retired graphs were not reclaimed");
  if (session.fallbackCount() > 0) {
    std::fprintf(stderr, "[concurrent_swaps] note: %llu timing transfers used the fallback\n",
                 static_cast<unsigned long long>(session.fallbackCount()));
  }
  return ok;
}

// Sample-clock graph with one oscillator; cps <= 0 leaves the tempo unstated.
static std::unique_ptr<Graph> sampleClockGraph(float freq, double cps) {
  auto g = std::make_unique<Graph>(48000.0, 256);
  g->setOutput(g->addNode(std::make_unique<OscillatorNode>(Signal(freq)), "osc"));
  if (cps > 0.0) g->setCps(cps);
  return g;
}

static double peakOf(const std::vector<float>& buf) {
  double peak = 0.0;
  for (float v : buf) peak = std::max(peak, static_cast<double>(std::fabs(v)));
  return peak;
}

// A running tempo other than the default must survive a swap to a patch that states none.
static bool testInstallInheritsTempo() {
  LiveSession session;
  std::vector<float> buf(256);
  session.install(sampleClockGraph(220.0f, 1.7));
  for (int b = 0; b < 5; ++b) session.renderNext(buf.data(), 256);
  bool ok = expect(session.activeCps() == 1.7, "install_inherits", "first graph tempo");
  session.install(sampleClockGraph(330.0f, -1.0));
  session.renderNext(buf.data(), 256);
  ok &= expect(session.activeCps() == 1.7, "install_inherits",
               "tempo after swap " + std::to_string(session.activeCps()) + ", expected 1.7");
  const double expected = 6.0 * 256.0 / 48000.0 * 1.7;
  ok &= expect(std::fabs(session.cyclePosition() - expected) < 1e-9, "install_inherits", "position continuous across the swap");
  return ok;
}

static bool testSetTempo() {
  LiveSession session;
  std::vector<float> buf(256);
  bool threw = false;
  try { session.setTempo(0.0); } catch (const std::invalid_argument&) { threw = true; }
  bool ok = expect(threw, "set_tempo", "cps 0 rejected");
  threw = false;
  try { session.setTempo(std::nan("")); } catch (const std::invalid_argument&) { threw = true; }
  ok &= expect(threw, "set_tempo", "NaN cps rejected");

  session.install(sampleClockGraph(220.0f, 0.5));
  for (int b = 0; b < 10; ++b) session.renderNext(buf.data(), 256);
  const double before = session.cyclePosition();
  session.setTempo(1.2);
  ok &= expect(session.activeCps() == 0.5, "set_tempo", "applied by the audio thread, not by the caller");
  session.renderNext(buf.data(), 256);
  ok &= expect(session.activeCps() == 1.2, "set_tempo", "tempo after the next buffer");
  ok &= expect(std::fabs(session.cyclePosition() - (before + 256.0 / 48000.0 * 1.2)) < 1e-9, "set_tempo",
               "position continuous through the tempo change");

  // a later patch without a tempo keeps the live one
  session.install(sampleClockGraph(330.0f, -1.0));
  session.renderNext(buf.data(), 256);
  ok &= expect(session.activeCps() == 1.2, "set_tempo", "swap kept the live tempo");

  // requested but not yet rendered: the incoming graph takes it
  session.setTempo(0.8);
  session.install(sampleClockGraph(440.0f, -1.0));
  session.renderNext(buf.data(), 256);
  ok &= expect(session.activeCps() == 0.8, "set_tempo", "pending tempo carried into the new graph, got " + std::to_string(session.activeCps()));

  // a patch that states its tempo wins over an older request
  session.setTempo(2.0);
  session.install(sampleClockGraph(550.0f, 0.5));
  for (int b = 0; b < 3; ++b) session.renderNext(buf.data(), 256);
  ok &= expect(session.activeCps() == 0.5, "set_tempo", "stated tempo overridden by a stale request");
  return ok;
}

static bool testHush() {
  LiveSession empty;
  bool ok = expect(!empty.hush(), "hush", "nothing to hush on a fresh session");

  LiveSession session;
  std::vector<float> buf(256);
  session.install(sampleClockGraph(220.0f, 0.5));
  for (int b = 0; b < 4; ++b) session.renderNext(buf.data(), 256);
  ok &= expect(peakOf(buf) > 0.1, "hush", "graph audible before hush");
  const double before = session.cyclePosition();

  ok &= expect(session.hush(), "hush", "hush of a playing session");
  ok &= expect(!session.hasGraph(), "hush", "no active graph after hush");
  ok &= expect(!session.hush(), "hush", "second hush is a no-op");
  for (int b = 0; b < 3; ++b) {
    std::fill(buf.begin(), buf.end(), 1.0f);
    session.renderNext(buf.data(), 256);
    ok &= expect(peakOf(buf) == 0.0, "hush", "silence while hushed");
  }

  session.install(sampleClockGraph(330.0f, -1.0));
  session.renderNext(buf.data(), 256);
  ok &= expect(session.hasGraph() && peakOf(buf) > 0.1, "hush", "next install plays again");
  ok &= expect(std::fabs(session.cyclePosition() - (before + 256.0 / 48000.0 * 0.5)) < 1e-9, "hush",
               "cycle resumes from the hushed position");
  ok &= expect(session.activeCps() == 0.5, "hush", "tempo inherited from the hushed graph");
  ok &= expect(session.swapCount() == 1, "hush", "install after hush replaces the hushed graph");
  session.renderNext(buf.data(), 256);
  session.collectRetired();
  ok &= expect(session.retiredCount() == 0, "hush", "hushed graph reclaimed");
  return ok;
}

// Tempo requests and swaps against a running audio thread: the clock stays monotonic.
static bool testLiveTempoChanges() {
  LiveSession session;
  session.install(compileEdit(0, true));

  AudioObservations obs;
  RealtimeGraphRenderer renderer;
  renderer.setSink([&session, &obs](const float* s, uint32_t n) {
    const double p = session.cyclePosition();
    if (p + 1e-9 < obs.lastPosition) obs.backwards.fetch_add(1, std::memory_order_relaxed);
    obs.lastPosition = p;
    for (uint32_t i = 0; i < n; ++i) {
      if (!std::isfinite(s[i])) { obs.nonFinite.fetch_add(1, std::memory_order_relaxed); break; }
    }
    obs.buffers.fetch_add(1, std::memory_order_relaxed);
  });
  renderer.start(session, 48000.0, 256);

  double last = kCps;
  for (int i = 1; i <= 60; ++i) {
    last = (i % 2) ? 0.75 : 0.5 + 0.01 * (i % 7);
    session.setTempo(last);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    if (i % 5 == 0) session.install(compileEdit(i, false));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  renderer.stop();

  bool ok = expect(obs.buffers.load() > 20, "live_tempo", "audio thread rendered too few buffers");
  ok &= expect(session.activeCps() == last, "live_tempo",
               "final tempo " + std::to_string(session.activeCps()) + " expected " + std::to_string(last));
  if (session.fallbackCount() == 0) {
    ok &= expect(obs.backwards.load() == 0, "live_tempo",
                 "cycle position went backwards " + std::to_string(obs.backwards.load()) + " times");
  }
  ok &= expect(obs.nonFinite.load() == 0, "live_tempo", "non-finite audio");
  return ok;
}

} // namespace

int main() {
  gSessionLogEnabled = false;
  bool ok = true;
  ok &= testSilenceWithoutGraph();
  ok &= testSampleClockSwaps();
  ok &= testBadEditKeepsGraph();
  ok &= testInstallInheritsTempo();
  ok &= testSetTempo();
  ok &= testHush();
  ok &= testLiveTempoChanges();
  ok &= testConcurrentSwaps();
  if (!ok) {
    std::fprintf(stderr, "test_live_session: FAILED\n");
    return 1;
  }
  std::printf("test_live_session: ok\n");
  return 0;
}
