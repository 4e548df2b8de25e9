#include "NodeFactory.hpp"
#include <cstdio>
#include <stdexcept>
#include "BiquadNode.hpp"
#include "CombFilterNode.hpp"
#include "CompressorNode.hpp"
#include "CyclePhaseNode.hpp"
#include "DelayNode.hpp"
#include "ImpulseNode.hpp"
#include "LineNode.hpp"
#include "MeterNode.hpp"
#include "MixerNode.hpp"
#include "NoiseNode.hpp"
#include "OscillatorNode.hpp"

using nlohmann::json;

const std::vector<NodeTypeInfo>& nodeTypeCatalogue() {
  static const std::vector<NodeTypeInfo> kTypes = {
    {"osc", {"freq", "wave", "phase"}, false, "oscillator (sine|saw|square|triangle)"},
    {"impulse", {"freq", "oneShot"}, false, "single-sample spikes at freq, or once"},
    {"noise", {"amp", "seed"}, false, "white noise"},
    {"line", {"start", "end", "duration", "trigger"}, false, "triggered linear ramp"},
    {"cyclephase", {"rate"}, false, "0..1 ramp locked to the cycle position"},
    {"lowpass", {"input", "cutoff", "q"}, false, "biquad low-pass"},
    {"highpass", {"input", "cutoff", "q"}, false, "biquad high-pass"},
    {"bandpass", {"input", "cutoff", "q"}, false, "biquad band-pass"},
    {"comb", {"input", "delay", "feedback", "maxDelay"}, true, "feedback comb filter"},
    {"delay", {"input", "time", "feedback", "mix", "maxDelay"}, true, "feedback delay"},
    {"compressor", {"input", "sidechain", "threshold", "ratio", "attack", "release", "makeup"}, false, "compressor"},
    {"mix", {"inputs", "gains", "master", "softClip"}, false, "gain-weighted sum"},
    {"meter", {"input"}, false, "pass-through peak/RMS meter"},
  };
  return kTypes;
}

const NodeTypeInfo* findNodeType(const std::string& type) {
  for (const auto& t : nodeTypeCatalogue()) if (type == t.type) return &t;
  return nullptr;
}

Signal parseSignalJson(const json& j, const NodeIdLookup& lookup, const std::string& where) {
  if (j.is_number()) return Signal(j.get<float>());
  if (j.is_boolean()) return Signal(j.get<bool>() ? 1.0f : 0.0f);
  if (j.is_string()) {
    const std::string s = j.get<std::string>();
    if (s.size() > 1 && s[0] == '@') return Signal::ref(lookup(s.substr(1)));
    throw std::invalid_argument(where + ": string signal must be a node reference '@id' (got '" + s + "')");
  }
  if (j.is_object()) {
    const std::string op = j.value("op", std::string());
    if (op == "scale") {
      if (!j.contains("input")) throw std::invalid_argument(where + ": scale needs 'input'");
      return Signal::scale(parseSignalJson(j.at("input"), lookup, where + ".input"),
                           j.value("min", 0.0f), j.value("max", 1.0f));
    }
    SignalOp sop = SignalOp::Add;
    if (op == "add") sop = SignalOp::Add;
    else if (op == "sub") sop = SignalOp::Sub;
    else if (op == "mul") sop = SignalOp::Mul;
    else if (op == "div") sop = SignalOp::Div;
    else if (op == "mod") sop = SignalOp::Mod;
    else throw std::invalid_argument(where + ": unknown signal op '" + op + "'");
    if (!j.contains("args") || !j.at("args").is_array() || j.at("args").empty()) {
      throw std::invalid_argument(where + ": '" + op + "' needs a non-empty 'args' array");
    }
    std::vector<Signal> args;
    size_t k = 0;
    for (const auto& a : j.at("args")) args.push_back(parseSignalJson(a, lookup, where + ".args[" + std::to_string(k++) + "]"));
    return Signal::expr(sop, std::move(args));
  }
  throw std::invalid_argument(where + ": unsupported signal value " + j.dump());
}

namespace {

struct ParamReader {
  const json& p;
  const NodeIdLookup& lookup;
  const std::string& nodeId;

  Signal sig(const char* key, float def) const {
    if (!p.contains(key)) return Signal(def);
    return parseSignalJson(p.at(key), lookup, "node '" + nodeId + "' param '" + key + "'");
  }
  bool has(const char* key) const { return p.contains(key); }
  std::vector<Signal> sigList(const char* key) const {
    std::vector<Signal> out;
    if (!p.contains(key)) return out;
    if (!p.at(key).is_array()) throw std::invalid_argument("node '" + nodeId + "' param '" + key + "' must be an array");
    size_t k = 0;
    for (const auto& e : p.at(key)) {
      out.push_back(parseSignalJson(e, lookup, "node '" + nodeId + "' param '" + key + "[" + std::to_string(k++) + "]'"));
    }
    return out;
  }
  // maxDelay sizes the look-back buffer at seal time; read as double so huge values never overflow to inf.
  float maxDelay(float def) const {
    const double v = setting<double>("maxDelay", def);
    if (!(v <= kMaxDelayLineSec)) {
      std::fprintf(stderr, "Warning: node '%s' maxDelay %g s exceeds %g s; clamped\n", nodeId.c_str(), v,
                   static_cast<double>(kMaxDelayLineSec));
      return kMaxDelayLineSec;
    }
    return static_cast<float>(v);
  }

  template <typename T> T setting(const char* key, T def) const {
    if (!p.contains(key)) return def;
    try { return p.at(key).get<T>(); }
    catch (const json::exception&) {
      throw std::invalid_argument("node '" + nodeId + "' setting '" + key + "' has the wrong type");
    }
  }
};

OscillatorNode::Wave parseWave(const std::string& w, const std::string& nodeId) {
  if (w == "sine") return OscillatorNode::Wave::Sine;
  if (w == "saw") return OscillatorNode::Wave::Saw;
  if (w == "square") return OscillatorNode::Wave::Square;
  if (w == "triangle") return OscillatorNode::Wave::Triangle;
  throw std::invalid_argument("node '" + nodeId + "': unknown wave '" + w + "'");
}

} // namespace

std::unique_ptr<Node> createNodeFromSpec(const NodeSpec& spec, const NodeIdLookup& lookup, uint32_t defaultSeed) {
  const NodeTypeInfo* info = findNodeType(spec.type);
  if (!info) throw std::invalid_argument("Unknown node type '" + spec.type + "' (id=" + spec.id + ")");

  json p;
  try {
    p = json::parse(spec.paramsJson.empty() ? std::string("{}") : spec.paramsJson);
  } catch (const json::parse_error& e) {
    throw std::invalid_argument("node '" + spec.id + "': params parse failed: " + e.what());
  }
  for (auto it = p.begin(); it != p.end(); ++it) {
    bool known = false;
    for (const char* k : info->keys) if (it.key() == k) { known = true; break; }
    if (!known) std::fprintf(stderr, "Warning: node '%s' (%s) ignores unknown param '%s'\n", spec.id.c_str(), spec.type.c_str(), it.key().c_str());
  }
  const ParamReader r{p, lookup, spec.id};
  const std::string& t = spec.type;

  if (t == "osc") {
    return std::make_unique<OscillatorNode>(r.sig("freq", 440.0f), parseWave(r.setting<std::string>("wave", "sine"), spec.id),
                                            r.setting<float>("phase", 0.0f));
  }
  if (t == "impulse") return std::make_unique<ImpulseNode>(r.sig("freq", 1.0f), r.setting<bool>("oneShot", false));
  if (t == "noise") return std::make_unique<NoiseNode>(r.sig("amp", 1.0f), r.setting<uint32_t>("seed", defaultSeed));
  if (t == "line") {
    return std::make_unique<LineNode>(r.sig("start", 0.0f), r.sig("end", 1.0f), r.sig("duration", 1.0f), r.sig("trigger", 0.0f));
  }
  if (t == "cyclephase") return std::make_unique<CyclePhaseNode>(r.sig("rate", 1.0f));
  if (t == "lowpass" || t == "highpass" || t == "bandpass") {
    const BiquadNode::Mode mode = (t == "lowpass") ? BiquadNode::Mode::LowPass
                                : (t == "highpass") ? BiquadNode::Mode::HighPass : BiquadNode::Mode::BandPass;
    return std::make_unique<BiquadNode>(mode, r.sig("input", 0.0f), r.sig("cutoff", 1000.0f), r.sig("q", 0.707f));
  }
  if (t == "comb") {
    return std::make_unique<CombFilterNode>(r.sig("input", 0.0f), r.sig("delay", 0.01f), r.sig("feedback", 0.5f),
                                            r.maxDelay(1.0f));
  }
  if (t == "delay") {
    return std::make_unique<DelayNode>(r.sig("input", 0.0f), r.sig("time", 0.35f), r.sig("feedback", 0.35f),
                                       r.sig("mix", 0.25f), r.maxDelay(2.0f));
  }
  if (t == "compressor") {
    Signal input = r.sig("input", 0.0f);
    Signal sidechain = r.has("sidechain") ? r.sig("sidechain", 0.0f) : input;
    return std::make_unique<CompressorNode>(input, sidechain, r.sig("threshold", -18.0f), r.sig("ratio", 2.0f),
                                            r.sig("attack", 10.0f), r.sig("release", 100.0f), r.sig("makeup", 0.0f));
  }
  if (t == "mix") {
    auto inputs = r.sigList("inputs");
    auto gains = r.sigList("gains");
    if (inputs.empty()) std::fprintf(stderr, "Warning: mix node '%s' has no inputs; it outputs silence\n", spec.id.c_str());
    if (gains.size() > inputs.size()) {
      throw std::invalid_argument("mix node '" + spec.id + "' has more gains than inputs");
    }
    return std::make_unique<MixerNode>(std::move(inputs), std::move(gains), r.setting<float>("master", 1.0f),
                                       r.setting<bool>("softClip", true));
  }
  if (t == "meter") return std::make_unique<MeterNode>(r.sig("input", 0.0f));
  throw std::invalid_argument("Unknown node type '" + spec.type + "' (id=" + spec.id + ")");
}
