#pragma once

#include <vector>
#include <memory>
#include <functional>
#include <string>
#include <cstdint>
#include "Node.hpp"
#include "Evaluator.hpp"
#include "GraphErrors.hpp"
#include "Transport.hpp"

inline constexpr int kDefaultTransferAttempts = 16;

// Node arena plus output designation and timing. Append-only until seal(); after that the
// structure is immutable and only node state and timing change while rendering.
class Graph {
public:
  explicit Graph(double sampleRate = 48000.0, uint32_t maxBlock = 512);

  Graph(const Graph&) = delete;
  Graph& operator=(const Graph&) = delete;

  // Construction (before seal)
  NodeId addNode(std::unique_ptr<Node> node, std::string label = {});
  // Reserve an id to be filled later; lets a node reference one inserted after it.
  NodeId reserveNode(std::string label = {});
  void setNode(NodeId id, std::unique_ptr<Node> node);
  void setOutput(NodeId id) { requireUnsealed("setOutput"); output_ = id; }
  // Validates references, analyses feedback, prepares nodes and allocates every buffer.
  // Throws GraphBuildError.
  void seal();

  bool isSealed() const { return sealed_; }
  NodeId output() const { return output_; }
  size_t nodeCount() const { return nodes_.size(); }
  double sampleRate() const { return transport_.sampleRate(); }
  uint32_t maxBlock() const { return maxBlock_; }
  const std::string& label(NodeId id) const { return labels_.at(id); }
  Node& node(NodeId id) { return *nodes_.at(id); }
  const Node& node(NodeId id) const { return *nodes_.at(id); }
  template <typename T> T* nodeAs(NodeId id) { return dynamic_cast<T*>(nodes_.at(id).get()); }
  void forEachNode(const std::function<void(NodeId, const std::string&, Node&)>& fn);

  // Rendering (after seal). Requests larger than maxBlock are split.
  void render(float* out, uint32_t frames) { evaluate(output_, out, frames); }
  void evaluate(NodeId id, float* out, uint32_t frames);

  void resetNode(NodeId id);
  void resetAll();
  NodeState nodeState(NodeId id) const;
  const FeedbackAnalysis& analysis() const;

  // Timing
  Transport& transport() { return transport_; }
  const Transport& transport() const { return transport_; }
  void enableWallClockTiming() { transport_.enableWallClock(); }
  double getCps() const { return transport_.cps(); }
  // Writes the transport: only the thread rendering the graph may call this once it is live
  // (LiveSession::setTempo routes through the audio thread).
  void setCps(double cps) { transport_.setCps(cps); }
  double getCyclePosition() const { return transport_.cyclePosition(); }
  // Copies timing from the graph being replaced. Returns false when the old timing stayed busy
  // for maxAttempts reads and a best-effort offset was installed instead.
  bool transferSessionTiming(const Graph& old, int maxAttempts = kDefaultTransferAttempts);

  // Session bookkeeping: set by the harness before the graph is published.
  uint64_t generation() const { return generation_; }
  void setGeneration(uint64_t g) { generation_ = g; }

private:
  void requireUnsealed(const char* what) const;
  std::string describe(NodeId id) const;

  std::vector<std::unique_ptr<Node>> nodes_;
  std::vector<std::string> labels_;
  NodeId output_ = kInvalidNodeId;
  uint32_t maxBlock_ = 512;
  bool sealed_ = false;
  Transport transport_;
  Evaluator evaluator_;
  uint64_t generation_ = 0;
};
