// Feedback loops: delay-providing nodes break cycles, everything else is rejected at seal time

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "core/BiquadNode.hpp"
#include "core/CombFilterNode.hpp"
#include "core/DelayNode.hpp"
#include "core/Graph.hpp"
#include "core/GraphErrors.hpp"
#include "core/ImpulseNode.hpp"
#include "core/MixerNode.hpp"
#include "core/NoiseNode.hpp"
#include "core/OscillatorNode.hpp"

namespace {

static bool expect(bool cond, const char* test, const std::string& msg) {
  if (!cond) std::fprintf(stderr, "[%s] FAILED: %s\n", test, msg.c_str());
  return cond;
}

static double rmsOf(const std::vector<float>& v) {
  long double acc = 0.0L;
  for (float s : v) acc += static_cast<long double>(s) * s;
  return v.empty() ? 0.0 : std::sqrt(static_cast<double>(acc / v.size()));
}

static bool allFinite(const std::vector<float>& v) {
  for (float s : v) if (!std::isfinite(s)) return false;
  return true;
}

// single impulse -> comb(10 ms, 0.7); the resonance must sustain across buffers
static bool testCombRings() {
  Graph g(48000.0, 512);
  const NodeId hit = g.addNode(std::make_unique<ImpulseNode>(Signal(1.0f), true), "hit");
  const NodeId comb = g.addNode(std::make_unique<CombFilterNode>(Signal::ref(hit), Signal(0.01f), Signal(0.7f), 0.1f), "comb");
  g.setOutput(comb);
  g.seal();

  bool ok = true;
  std::vector<float> all;
  std::vector<float> buf(512);
  for (int b = 0; b < 10; ++b) {
    g.render(buf.data(), 512);
    ok &= expect(allFinite(buf), "comb_rings", "non-finite sample in buffer " + std::to_string(b));
    ok &= expect(rmsOf(buf) > 0.0, "comb_rings", "resonance died out in buffer " + std::to_string(b));
    all.insert(all.end(), buf.begin(), buf.end());
  }
  ok &= expect(std::fabs(all[0] - 1.0f) < 1e-6f, "comb_rings", "impulse passes on sample 0");
  // echoes every 480 samples, each 0.7x the previous
  ok &= expect(std::fabs(all[480] - 0.7f) < 1e-5f, "comb_rings", "first echo at 10 ms, got " + std::to_string(all[480]));
  ok &= expect(std::fabs(all[960] - 0.49f) < 1e-5f, "comb_rings", "second echo at 20 ms, got " + std::to_string(all[960]));
  ok &= expect(std::fabs(all[100]) < 1e-6f, "comb_rings", "silence between echoes");
  return ok;
}

// mixer -> delay -> mixer: legal because the delay provides delay. Loop gain is above 1; the
// mixer's soft clip keeps it bounded.
static bool testDelayLoopStaysFinite() {
  Graph g(48000.0, 256);
  const NodeId src = g.addNode(std::make_unique<NoiseNode>(Signal(0.5f), 3u), "src");
  const NodeId echo = g.reserveNode("echo");
  const NodeId bus = g.addNode(std::make_unique<MixerNode>(
    std::vector<Signal>{Signal::ref(src), Signal::ref(echo)}, std::vector<Signal>{Signal(1.0f), Signal(0.95f)}, 1.0f, true), "bus");
  g.setNode(echo, std::make_unique<DelayNode>(Signal::ref(bus), Signal(0.05f), Signal(0.99f), Signal(1.0f), 0.2f));
  g.setOutput(bus);
  g.seal();

  const auto& fa = g.analysis();
  bool ok = expect(fa.feedbackEdges.size() == 1, "delay_loop", "one feedback edge expected");
  if (!fa.feedbackEdges.empty()) {
    ok &= expect(fa.feedbackEdges[0] == std::make_pair(bus, echo), "delay_loop", "feedback edge is bus -> echo");
  }

  std::vector<float> buf(256);
  const int buffers = static_cast<int>(5.0 * 48000.0 / 256.0);
  bool finite = true;
  double lastRms = 0.0;
  for (int b = 0; b < buffers; ++b) {
    g.render(buf.data(), 256);
    finite = finite && allFinite(buf);
    lastRms = rmsOf(buf);
  }
  ok &= expect(finite, "delay_loop", "non-finite output over 5 s");
  ok &= expect(lastRms > 0.0, "delay_loop", "loop went silent");
  return ok;
}

static bool testLoopWithoutDelayRejected() {
  Graph g(48000.0, 128);
  const NodeId a = g.reserveNode("a");
  const NodeId b = g.addNode(std::make_unique<BiquadNode>(BiquadNode::Mode::HighPass, Signal::ref(a), Signal(200.0f), Signal(0.7f)), "b");
  g.setNode(a, std::make_unique<BiquadNode>(BiquadNode::Mode::LowPass, Signal::ref(b) + 0.1f, Signal(800.0f), Signal(0.7f)));
  g.setOutput(a);
  try {
    g.seal();
  } catch (const GraphBuildError& e) {
    bool ok = expect(e.kind() == GraphBuildError::Kind::FeedbackWithoutDelay, "loop_without_delay", "wrong error kind");
    const std::string msg = e.what();
    ok &= expect(msg.find("a") != std::string::npos && msg.find("b") != std::string::npos,
                 "loop_without_delay", "message should name the loop: " + msg);
    ok &= expect(!g.isSealed(), "loop_without_delay", "failed seal leaves the graph unsealed");
    return ok;
  }
  return expect(false, "loop_without_delay", "seal accepted a loop with no delay");
}

static bool testSelfLoops() {
  bool ok = true;
  {
    Graph g;
    const NodeId self = g.reserveNode("self");
    g.setNode(self, std::make_unique<OscillatorNode>(Signal::ref(self) * 100.0f + 220.0f));
    g.setOutput(self);
    bool rejected = false;
    try { g.seal(); } catch (const GraphBuildError& e) { rejected = e.kind() == GraphBuildError::Kind::FeedbackWithoutDelay; }
    ok &= expect(rejected, "self_loop", "oscillator reading itself must be rejected");
  }
  {
    Graph g(48000.0, 64);
    const NodeId hit = g.addNode(std::make_unique<ImpulseNode>(Signal(1.0f), true), "hit");
    const NodeId comb = g.reserveNode("comb");
    // feedback amount modulated by the comb's own (one-sample-late) output
    g.setNode(comb, std::make_unique<CombFilterNode>(Signal::ref(hit), Signal(0.002f), Signal::ref(comb) * 0.1f + 0.5f, 0.01f));
    g.setOutput(comb);
    bool accepted = true;
    try { g.seal(); } catch (const GraphBuildError& e) { accepted = false; std::fprintf(stderr, "%s\n", e.what()); }
    ok &= expect(accepted, "self_loop", "comb reading itself must be accepted");
    if (accepted) {
      std::vector<float> buf(64 * 40);
      g.render(buf.data(), static_cast<uint32_t>(buf.size()));
      ok &= expect(allFinite(buf) && rmsOf(buf) > 0.0, "self_loop", "self-modulated comb renders");
    }
  }
  return ok;
}

// Loop members evaluate per sample; nodes around the loop keep block processing.
static bool testAnalysisShape() {
  Graph g(48000.0, 128);
  const NodeId osc = g.addNode(std::make_unique<OscillatorNode>(Signal(110.0f)), "osc");
  const NodeId echo = g.reserveNode("echo");
  const NodeId bus = g.addNode(std::make_unique<MixerNode>(
    std::vector<Signal>{Signal::ref(osc), Signal::ref(echo)}, std::vector<Signal>{}, 1.0f, true), "bus");
  g.setNode(echo, std::make_unique<DelayNode>(Signal::ref(bus), Signal(0.01f), Signal(0.5f), Signal(1.0f), 0.1f));
  const NodeId lp = g.addNode(std::make_unique<BiquadNode>(BiquadNode::Mode::LowPass, Signal::ref(bus), Signal(900.0f), Signal(0.7f)), "lp");
  g.setOutput(lp);
  g.seal();
  const auto& fa = g.analysis();
  bool ok = expect(fa.componentOf[bus] == fa.componentOf[echo], "analysis_shape", "bus and echo share a component");
  ok &= expect(fa.cyclic[fa.componentOf[bus]], "analysis_shape", "loop component is cyclic");
  ok &= expect(!fa.cyclic[fa.componentOf[osc]] && !fa.cyclic[fa.componentOf[lp]], "analysis_shape", "osc and lp are acyclic");
  ok &= expect(fa.componentOf[osc] < fa.componentOf[bus] && fa.componentOf[bus] < fa.componentOf[lp],
               "analysis_shape", "components are in dependency order");
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok &= testCombRings();
  ok &= testDelayLoopStaysFinite();
  ok &= testLoopWithoutDelayRejected();
  ok &= testSelfLoops();
  ok &= testAnalysisShape();
  if (!ok) {
    std::fprintf(stderr, "test_feedback: FAILED\n");
    return 1;
  }
  std::printf("test_feedback: ok\n");
  return 0;
}
