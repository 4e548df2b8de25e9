#include "PatchCompiler.hpp"
#include "NodeFactory.hpp"
#include <unordered_map>

std::unique_ptr<Graph> compilePatch(const PatchSpec& spec, const CompileOptions& opts) {
  const uint32_t sampleRate = opts.sampleRate ? opts.sampleRate : spec.sampleRate;
  const uint32_t maxBlock = opts.maxBlock ? opts.maxBlock : spec.maxBlock;
  auto graph = std::make_unique<Graph>(static_cast<double>(sampleRate), maxBlock);

  std::unordered_map<std::string, NodeId> ids;
  ids.reserve(spec.nodes.size());
  for (const auto& n : spec.nodes) {
    if (ids.count(n.id)) throw std::invalid_argument("duplicate node id '" + n.id + "' in " + spec.origin);
    ids.emplace(n.id, graph->reserveNode(n.id));
  }

  const uint32_t baseSeed = opts.randomSeed ? opts.randomSeed : (spec.randomSeed ? spec.randomSeed : 1u);
  for (const auto& n : spec.nodes) {
    const NodeIdLookup lookup = [&](const std::string& ref) -> NodeId {
      auto it = ids.find(ref);
      if (it == ids.end()) {
        throw GraphBuildError(GraphBuildError::Kind::DanglingNodeRef,
                              "node '" + n.id + "' references unknown node '" + ref + "'");
      }
      return it->second;
    };
    const NodeId id = ids.at(n.id);
    graph->setNode(id, createNodeFromSpec(n, lookup, baseSeed + id));
  }

  if (spec.output.empty()) {
    throw GraphBuildError(GraphBuildError::Kind::MissingOutput, "patch " + spec.origin + " has no 'output'");
  }
  auto out = ids.find(spec.output);
  if (out == ids.end()) {
    throw GraphBuildError(GraphBuildError::Kind::DanglingNodeRef, "output references unknown node '" + spec.output + "'");
  }
  graph->setOutput(out->second);

  if (opts.cps > 0.0) graph->setCps(opts.cps);
  else if (spec.hasCps) graph->setCps(spec.cps);

  graph->seal();
  return graph;
}
