#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Node.hpp"
#include "PatchConfig.hpp"

// Resolves a patch node id to its NodeId; throws GraphBuildError(DanglingNodeRef) when unknown.
using NodeIdLookup = std::function<NodeId(const std::string&)>;

struct NodeTypeInfo {
  const char* type;
  std::vector<const char*> keys; // accepted params keys (signals and settings)
  bool providesDelay;
  const char* summary;
};

const std::vector<NodeTypeInfo>& nodeTypeCatalogue();
const NodeTypeInfo* findNodeType(const std::string& type);

// number -> Constant, "@id" -> NodeRef, {"op": ...} -> Expression.
// `where` names the parameter in error messages.
Signal parseSignalJson(const nlohmann::json& j, const NodeIdLookup& lookup, const std::string& where);

// Throws std::invalid_argument for unknown types or malformed params.
std::unique_ptr<Node> createNodeFromSpec(const NodeSpec& spec, const NodeIdLookup& lookup, uint32_t defaultSeed);
