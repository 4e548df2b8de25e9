#include "Graph.hpp"
#include "Backoff.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

Graph::Graph(double sampleRate, uint32_t maxBlock)
: maxBlock_(std::max<uint32_t>(1, maxBlock)), transport_(sampleRate) {}

NodeId Graph::addNode(std::unique_ptr<Node> node, std::string label) {
  requireUnsealed("addNode");
  if (!node) throw std::invalid_argument("addNode: null node");
  const NodeId id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(std::move(node));
  labels_.push_back(std::move(label));
  return id;
}

NodeId Graph::reserveNode(std::string label) {
  requireUnsealed("reserveNode");
  const NodeId id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(nullptr);
  labels_.push_back(std::move(label));
  return id;
}

void Graph::setNode(NodeId id, std::unique_ptr<Node> node) {
  requireUnsealed("setNode");
  if (id >= nodes_.size()) throw std::out_of_range("setNode: NodeId " + std::to_string(id) + " was not reserved");
  if (nodes_[id]) throw std::logic_error("setNode: NodeId " + std::to_string(id) + " is already filled");
  if (!node) throw std::invalid_argument("setNode: null node");
  nodes_[id] = std::move(node);
}

void Graph::forEachNode(const std::function<void(NodeId, const std::string&, Node&)>& fn) {
  for (NodeId i = 0; i < nodes_.size(); ++i) if (nodes_[i]) fn(i, labels_[i], *nodes_[i]);
}

std::string Graph::describe(NodeId id) const {
  std::string s = labels_[id].empty() ? ("#" + std::to_string(id)) : labels_[id];
  if (nodes_[id]) { s += " ("; s += nodes_[id]->name(); s += ")"; }
  return s;
}

void Graph::seal() {
  requireUnsealed("seal");
  for (NodeId i = 0; i < nodes_.size(); ++i) {
    if (!nodes_[i]) {
      throw GraphBuildError(GraphBuildError::Kind::EmptyNodeSlot,
                            "NodeId " + std::to_string(i) + " (" + labels_[i] + ") was reserved but never set");
    }
  }
  for (NodeId i = 0; i < nodes_.size(); ++i) {
    for (NodeId ref : nodes_[i]->inputNodeIds()) {
      if (ref >= nodes_.size()) {
        throw GraphBuildError(GraphBuildError::Kind::DanglingNodeRef,
                              "node " + describe(i) + " references unknown NodeId " + std::to_string(ref));
      }
    }
  }
  if (output_ == kInvalidNodeId) {
    throw GraphBuildError(GraphBuildError::Kind::MissingOutput, "graph has no output node");
  }
  if (output_ >= nodes_.size()) {
    throw GraphBuildError(GraphBuildError::Kind::DanglingNodeRef,
                          "output references unknown NodeId " + std::to_string(output_));
  }

  std::vector<Node*> raw;
  std::vector<std::string> names;
  raw.reserve(nodes_.size());
  names.reserve(nodes_.size());
  for (NodeId i = 0; i < nodes_.size(); ++i) { raw.push_back(nodes_[i].get()); names.push_back(describe(i)); }
  evaluator_.build(raw, names, maxBlock_);

  for (auto& n : nodes_) n->prepare(transport_.sampleRate(), maxBlock_);
  sealed_ = true;
}

void Graph::evaluate(NodeId id, float* out, uint32_t frames) {
  if (!sealed_) throw std::logic_error("Graph::evaluate called before seal()");
  if (id >= nodes_.size()) throw std::out_of_range("Graph::evaluate: unknown NodeId " + std::to_string(id));
  uint32_t done = 0;
  while (done < frames) {
    const uint32_t block = std::min(maxBlock_, frames - done);
    const ProcessContext ctx = transport_.beginBlock(block);
    evaluator_.run(ctx, id);
    std::memcpy(out + done, evaluator_.output(id), sizeof(float) * block);
    transport_.endBlock(block);
    done += block;
  }
}

void Graph::resetNode(NodeId id) {
  nodes_.at(id)->reset();
  if (sealed_) evaluator_.markReset(id);
}

void Graph::resetAll() {
  for (NodeId i = 0; i < nodes_.size(); ++i) resetNode(i);
}

NodeState Graph::nodeState(NodeId id) const {
  if (id >= nodes_.size()) throw std::out_of_range("nodeState: unknown NodeId " + std::to_string(id));
  return sealed_ ? evaluator_.nodeState(id) : NodeState::Uninitialized;
}

const FeedbackAnalysis& Graph::analysis() const {
  if (!sealed_) throw std::logic_error("Graph::analysis called before seal()");
  return evaluator_.analysis();
}

bool Graph::transferSessionTiming(const Graph& old, int maxAttempts) {
  TimingSnapshot snap;
  Backoff backoff;
  for (int attempt = 0; attempt < maxAttempts; ++attempt) {
    if (old.transport_.trySnapshot(snap)) {
      transport_.adoptTiming(snap, Transport::Clock::now());
      return true;
    }
    backoff.wait();
  }
  transport_.adoptFallback(old.transport_.cyclePosition(), old.transport_.cps(),
                           old.transport_.mode(), old.transport_.samplesRendered());
  return false;
}

void Graph::requireUnsealed(const char* what) const {
  if (sealed_) throw std::logic_error(std::string(what) + ": graph is sealed");
}
