#pragma once

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>
#include "Graph.hpp"

inline void printEvaluationPlan(const Graph& g);
inline std::string exportMermaidFromGraph(const Graph& g);

// Inline impls
inline void printEvaluationPlan(const Graph& g) {
  const FeedbackAnalysis& fa = g.analysis();
  std::fprintf(stderr, "Evaluation plan (%zu nodes, %zu components):\n", g.nodeCount(), fa.components.size());
  for (size_t c = 0; c < fa.components.size(); ++c) {
    const auto& members = fa.components[c];
    if (!fa.cyclic[c]) {
      const NodeId v = members.front();
      std::fprintf(stderr, "  [%zu] block   %s (%s)\n", c, g.label(v).c_str(), g.node(v).name());
      continue;
    }
    std::fprintf(stderr, "  [%zu] sample  ", c);
    for (size_t i = 0; i < members.size(); ++i) {
      std::fprintf(stderr, "%s%s", g.label(members[i]).c_str(), (i + 1 < members.size() ? " -> " : "\n"));
    }
  }
  if (!fa.feedbackEdges.empty()) {
    std::fprintf(stderr, "Feedback edges (%zu):\n", fa.feedbackEdges.size());
    for (const auto& e : fa.feedbackEdges) {
      std::fprintf(stderr, "  %s -> %s (delay: %s)\n", g.label(e.first).c_str(), g.label(e.second).c_str(), g.node(e.second).name());
    }
  }
  std::fprintf(stderr, "Output: %s\n", g.label(g.output()).c_str());
}

// Mermaid flowchart; feedback edges are drawn dotted.
inline std::string exportMermaidFromGraph(const Graph& g) {
  std::ostringstream out;
  out << "flowchart LR\n";
  for (NodeId i = 0; i < g.nodeCount(); ++i) {
    out << "  n" << i << "[\"" << g.node(i).name() << ": " << g.label(i) << "\"]\n";
  }
  const auto& fb = g.analysis().feedbackEdges;
  for (NodeId v = 0; v < g.nodeCount(); ++v) {
    for (NodeId u : g.node(v).inputNodeIds()) {
      const bool feedback = std::find(fb.begin(), fb.end(), std::make_pair(u, v)) != fb.end();
      out << "  n" << u << (feedback ? " -.-> " : " --> ") << "n" << v << "\n";
    }
  }
  out << "  n" << g.output() << " --> Out((\"out\"))\n";
  return out.str();
}
