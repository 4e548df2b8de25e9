#pragma once

#include <memory>
#include <cstdint>
#include "Graph.hpp"
#include "PatchConfig.hpp"

// Overrides applied on top of the patch (0 / negative means "use the patch value").
struct CompileOptions {
  uint32_t sampleRate = 0;
  uint32_t maxBlock = 0;
  double cps = -1.0;
  uint32_t randomSeed = 0;
};

// Builds and seals a Graph from a patch. Every NodeId is reserved before any node is built, so
// signals may reference nodes declared later (feedback loops) or the node itself.
// Throws GraphBuildError for structural problems and std::invalid_argument for bad params.
std::unique_ptr<Graph> compilePatch(const PatchSpec& spec, const CompileOptions& opts = {});
