#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "BufferPool.hpp"
#include "FeedbackAnalysis.hpp"
#include "Node.hpp"

enum class NodeState : uint8_t { Uninitialized, Steady };

// Buffer evaluator for a sealed node arena.
//
// build() runs once at seal time: cycle analysis, buffer allocation and input wiring. run() is the
// realtime path: memoized post-order over the component DAG rooted at the requested node, each
// component evaluated at most once per call. Acyclic nodes process whole blocks; components that
// contain feedback process one sample at a time in a fixed order, with feedback edges reading the
// source's previous-sample output.
class Evaluator {
public:
  void build(const std::vector<Node*>& nodes, const std::vector<std::string>& labels, uint32_t maxBlock);

  void run(ProcessContext ctx, NodeId root);

  const float* output(NodeId id) const { return out_[id]; }
  NodeState nodeState(NodeId id) const { return static_cast<NodeState>(states_[id]); }
  void markReset(NodeId id) { states_[id] = static_cast<uint8_t>(NodeState::Uninitialized); *lastOut_[id] = 0.0f; }
  const FeedbackAnalysis& analysis() const { return analysis_; }
  uint32_t maxBlock() const { return maxBlock_; }

private:
  struct InputSlot {
    const float* base = nullptr;  // buffer (stride 1) or held feedback value (stride 0)
    uint32_t stride = 1;
    float* scratch = nullptr;     // expression target
    const Signal* expr = nullptr; // set when the input must be re-evaluated every block/sample
  };

  void evaluateComponent(uint32_t c, const ProcessContext& ctx);
  void processBlock(NodeId v, const ProcessContext& ctx);
  void processPerSample(uint32_t c, const ProcessContext& ctx);
  void resolveSignal(const Signal& s, NodeId consumer, float* dst, uint32_t offset, uint32_t n, uint32_t depth);
  bool isFeedback(NodeId source, NodeId consumer) const { return analysis_.isFeedbackEdge(source, consumer, delay_); }

  std::vector<Node*> nodes_;
  std::vector<bool> delay_;
  FeedbackAnalysis analysis_;
  BufferPool pool_;
  std::vector<float*> out_;
  std::vector<float*> lastOut_;
  std::vector<std::vector<InputSlot>> slots_;
  std::vector<std::vector<const float*>> argv_;
  std::vector<float*> exprTmp_;
  std::vector<uint8_t> states_;
  std::vector<uint64_t> stamp_;
  uint64_t currentStamp_ = 0;
  uint32_t maxBlock_ = 0;
};
