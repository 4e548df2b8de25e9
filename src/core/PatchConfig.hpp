#pragma once

#include <string>
#include <vector>
#include <cstdint>

struct NodeSpec {
  std::string id;
  std::string type;
  // raw JSON for params will be parsed per type in the factory
  std::string paramsJson = "{}";
};

struct PatchSpec {
  std::string description; // optional human-readable description
  std::string origin;      // file path or "<text>", for diagnostics
  int version = 1;
  uint32_t sampleRate = 48000;
  uint32_t maxBlock = 512;
  bool hasCps = false;     // absent: a hot-swapped patch keeps the running tempo
  double cps = 0.5;
  uint32_t randomSeed = 0; // 0 means unspecified
  std::string output;      // node id
  std::vector<NodeSpec> nodes;
};

// Parse file into PatchSpec using nlohmann/json. Relative paths are searched in the CWD,
// examples/patches/ and CYCLEGRAPH_SEARCH_PATHS (colon-separated).
PatchSpec loadPatchSpecFromJsonFile(const std::string& path);
PatchSpec parsePatchSpecFromJsonText(const std::string& text, const std::string& origin = "<text>");
// Resolved path of a patch file (same search as loadPatchSpecFromJsonFile), or empty.
std::string resolvePatchPath(const std::string& path);
