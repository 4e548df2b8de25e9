#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "Signal.hpp"

// Compile-time cycle analysis over node dependencies.
//
// deps[v] lists the nodes v reads from. Strongly connected components are found with Tarjan's
// algorithm, which emits a component only after every component it depends on, so the component
// list is already in evaluation order. Inside a component, an edge u -> v is a feedback edge when
// v provides delay; removing feedback edges must leave the component acyclic.
struct FeedbackAnalysis {
  std::vector<uint32_t> componentOf;                  // node -> component index
  std::vector<std::vector<NodeId>> components;        // evaluation order; members in per-sample order
  std::vector<bool> cyclic;                           // component needs per-sample evaluation
  std::vector<std::vector<uint32_t>> upstream;        // component -> components it reads from
  std::vector<std::pair<NodeId, NodeId>> feedbackEdges; // (source, consumer)

  bool isFeedbackEdge(NodeId source, NodeId consumer, const std::vector<bool>& delay) const {
    const uint32_t c = componentOf[consumer];
    return cyclic[c] && componentOf[source] == c && delay[consumer];
  }
};

// Throws GraphBuildError(FeedbackWithoutDelay) naming the nodes of an illegal loop.
// labels[i] is used in diagnostics only.
FeedbackAnalysis analyzeFeedback(const std::vector<std::vector<NodeId>>& deps,
                                 const std::vector<bool>& providesDelay,
                                 const std::vector<std::string>& labels);
