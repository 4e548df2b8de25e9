#include "PatchConfig.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

std::vector<std::string> searchRoots() {
  std::vector<std::string> roots;
  roots.emplace_back("");
  roots.emplace_back("examples/patches/");
  if (const char* env = std::getenv("CYCLEGRAPH_SEARCH_PATHS")) {
    std::string s(env);
    size_t start = 0; while (start <= s.size()) {
      size_t sep = s.find(':', start);
      std::string tok = (sep == std::string::npos) ? s.substr(start) : s.substr(start, sep - start);
      if (!tok.empty()) {
        if (tok.back() != '/') tok.push_back('/');
        roots.push_back(tok);
      }
      if (sep == std::string::npos) break; else start = sep + 1;
    }
  }
  return roots;
}

std::string readFileToString(const std::string& path) {
  std::ifstream f(path);
  if (!f) throw std::runtime_error("Failed to open patch file: " + path);
  std::ostringstream ss; ss << f.rdbuf();
  return ss.str();
}

} // namespace

std::string resolvePatchPath(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_regular_file(path, ec)) return path;
  if (std::filesystem::path(path).is_absolute()) return {};
  for (const auto& r : searchRoots()) {
    const std::string candidate = r + path;
    if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
  }
  return {};
}

PatchSpec loadPatchSpecFromJsonFile(const std::string& path) {
  const std::string resolved = resolvePatchPath(path);
  if (resolved.empty()) throw std::runtime_error("Failed to open patch file: " + path);
  return parsePatchSpecFromJsonText(readFileToString(resolved), resolved);
}

PatchSpec parsePatchSpecFromJsonText(const std::string& text, const std::string& origin) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Patch JSON parse error in " + origin + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error(origin + ": top-level must be object");

  if (j.contains("kind")) {
    const std::string k = j.at("kind").get<std::string>();
    if (k != "patch") throw std::runtime_error("JSON kind mismatch: expected 'patch' but got '" + k + "' in " + origin);
  } else {
    std::fprintf(stderr, "Warning: patch JSON missing 'kind'; assuming patch (%s)\n", origin.c_str());
  }

  PatchSpec spec;
  spec.origin = origin;
  try {
    spec.description = j.value("description", std::string());
    spec.version = j.value("version", 1);
    spec.sampleRate = j.value("sampleRate", 48000u);
    spec.maxBlock = j.value("maxBlock", 512u);
    if (j.contains("cps")) { spec.hasCps = true; spec.cps = j.at("cps").get<double>(); }
    spec.randomSeed = j.value("randomSeed", 0u);
    spec.output = j.value("output", std::string());

    if (!j.contains("nodes") || !j.at("nodes").is_array()) {
      throw std::runtime_error(origin + ": missing array 'nodes'");
    }
    std::unordered_set<std::string> seen;
    for (const auto& n : j.at("nodes")) {
      if (!n.is_object()) throw std::runtime_error(origin + ": node entry is not an object");
      NodeSpec ns;
      ns.id = n.at("id").get<std::string>();
      ns.type = n.at("type").get<std::string>();
      if (n.contains("params")) {
        if (!n.at("params").is_object()) throw std::runtime_error(origin + ": params of '" + ns.id + "' must be an object");
        ns.paramsJson = n.at("params").dump();
      }
      if (!seen.insert(ns.id).second) throw std::runtime_error(origin + ": duplicate node id '" + ns.id + "'");
      spec.nodes.push_back(std::move(ns));
    }
  } catch (const json::exception& e) {
    throw std::runtime_error("Patch JSON error in " + origin + ": " + e.what());
  }
  if (spec.sampleRate < 8000u) {
    std::fprintf(stderr, "Warning: sampleRate %u too low; using 8000 (%s)\n", spec.sampleRate, origin.c_str());
    spec.sampleRate = 8000u;
  }
  if (spec.maxBlock == 0u) spec.maxBlock = 512u;
  return spec;
}
