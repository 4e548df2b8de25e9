#include "FeedbackAnalysis.hpp"
#include "GraphErrors.hpp"
#include <algorithm>

namespace {

struct TarjanScc {
  explicit TarjanScc(const std::vector<std::vector<NodeId>>& d)
  : deps(d), index(d.size(), -1), low(d.size(), 0), onStack(d.size(), false) {}

  void visit(NodeId v) {
    index[v] = low[v] = counter++;
    stack.push_back(v); onStack[v] = true;
    for (NodeId u : deps[v]) {
      if (index[u] < 0) {
        visit(u);
        low[v] = std::min(low[v], low[u]);
      } else if (onStack[u]) {
        low[v] = std::min(low[v], index[u]);
      }
    }
    if (low[v] == index[v]) {
      std::vector<NodeId> comp;
      NodeId w = kInvalidNodeId;
      do {
        w = stack.back(); stack.pop_back();
        onStack[w] = false;
        comp.push_back(w);
      } while (w != v);
      std::sort(comp.begin(), comp.end());
      components.push_back(std::move(comp));
    }
  }

  const std::vector<std::vector<NodeId>>& deps;
  std::vector<int> index;
  std::vector<int> low;
  std::vector<bool> onStack;
  std::vector<NodeId> stack;
  std::vector<std::vector<NodeId>> components;
  int counter = 0;
};

bool reads(const std::vector<std::vector<NodeId>>& deps, NodeId consumer, NodeId source) {
  const auto& d = deps[consumer];
  return std::find(d.begin(), d.end(), source) != d.end();
}

// Walks non-feedback predecessors among the unordered nodes until one repeats, then formats the
// loop in signal-flow order.
std::string describeLoop(const std::vector<std::vector<NodeId>>& deps,
                         const std::vector<bool>& delay,
                         const std::vector<NodeId>& remaining,
                         const std::vector<std::string>& labels) {
  auto isRemaining = [&](NodeId n) { return std::find(remaining.begin(), remaining.end(), n) != remaining.end(); };
  std::vector<NodeId> path;
  NodeId cur = remaining.front();
  while (std::find(path.begin(), path.end(), cur) == path.end()) {
    path.push_back(cur);
    NodeId next = kInvalidNodeId;
    if (!delay[cur]) {
      for (NodeId u : deps[cur]) if (isRemaining(u)) { next = u; break; }
    }
    if (next == kInvalidNodeId) break;
    cur = next;
  }
  auto start = std::find(path.begin(), path.end(), cur);
  std::vector<NodeId> loop(start, path.end());
  std::reverse(loop.begin(), loop.end());
  std::string s;
  for (NodeId n : loop) { s += labels[n]; s += " -> "; }
  if (!loop.empty()) s += labels[loop.front()];
  return s;
}

} // namespace

FeedbackAnalysis analyzeFeedback(const std::vector<std::vector<NodeId>>& deps,
                                 const std::vector<bool>& providesDelay,
                                 const std::vector<std::string>& labels) {
  const size_t n = deps.size();
  TarjanScc scc(deps);
  for (NodeId v = 0; v < n; ++v) if (scc.index[v] < 0) scc.visit(v);

  FeedbackAnalysis fa;
  fa.componentOf.assign(n, 0u);
  for (uint32_t c = 0; c < scc.components.size(); ++c) {
    for (NodeId v : scc.components[c]) fa.componentOf[v] = c;
  }
  fa.components.reserve(scc.components.size());
  fa.cyclic.assign(scc.components.size(), false);
  fa.upstream.assign(scc.components.size(), {});

  for (uint32_t c = 0; c < scc.components.size(); ++c) {
    const auto& members = scc.components[c];
    const bool cyclic = members.size() > 1 || reads(deps, members.front(), members.front());
    fa.cyclic[c] = cyclic;

    for (NodeId v : members) {
      for (NodeId u : deps[v]) {
        const uint32_t cu = fa.componentOf[u];
        if (cu != c) {
          auto& up = fa.upstream[c];
          if (std::find(up.begin(), up.end(), cu) == up.end()) up.push_back(cu);
        } else if (providesDelay[v]) {
          fa.feedbackEdges.emplace_back(u, v);
        }
      }
    }

    if (!cyclic) { fa.components.push_back(members); continue; }

    // Kahn over intra-component edges, feedback edges removed; lowest NodeId first.
    std::vector<NodeId> remaining = members;
    std::vector<NodeId> order;
    order.reserve(members.size());
    auto ready = [&](NodeId v) {
      if (providesDelay[v]) return true;
      for (NodeId u : deps[v]) {
        if (fa.componentOf[u] == c && std::find(remaining.begin(), remaining.end(), u) != remaining.end()) return false;
      }
      return true;
    };
    bool progressed = true;
    while (!remaining.empty() && progressed) {
      progressed = false;
      for (size_t i = 0; i < remaining.size(); ++i) {
        if (ready(remaining[i])) {
          order.push_back(remaining[i]);
          remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
          progressed = true;
          break;
        }
      }
    }
    if (!remaining.empty()) {
      throw GraphBuildError(GraphBuildError::Kind::FeedbackWithoutDelay,
                            "feedback loop without a delay-providing node: " +
                            describeLoop(deps, providesDelay, remaining, labels));
    }
    fa.components.push_back(std::move(order));
  }
  return fa;
}
