#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "core/Graph.hpp"
#include "core/GraphUtils.hpp"
#include "core/MeterNode.hpp"
#include "core/NodeFactory.hpp"
#include "core/PatchCompiler.hpp"
#include "core/PatchConfig.hpp"
#include "offline/OfflineGraphRenderer.hpp"
#include "offline/OfflineProgress.hpp"
#include "realtime/RealtimeGraphRenderer.hpp"
#include "session/LiveSession.hpp"

static std::atomic<bool> gRunning{true};

static void onSigInt(int) {
  gRunning.store(false);
}

static std::string formatDuration(double seconds) {
  if (seconds < 0.0) seconds = 0.0;
  const int64_t totalMs = static_cast<int64_t>(seconds * 1000.0 + 0.5);
  const int64_t mins = totalMs / (60 * 1000);
  const int64_t secs = (totalMs % (60 * 1000)) / 1000;
  const int64_t ms = totalMs % 1000;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%03lld",
                static_cast<long long>(mins), static_cast<long long>(secs), static_cast<long long>(ms));
  return std::string(buf);
}

static void computePeakAndRms(const std::vector<float>& samples, double& outPeakDb, double& outRmsDb, size_t& nonFinite) {
  double peak = 0.0;
  long double sumSq = 0.0L;
  nonFinite = 0;
  for (float f : samples) {
    const double s = static_cast<double>(f);
    if (!std::isfinite(s)) { ++nonFinite; continue; }
    peak = std::max(peak, std::fabs(s));
    sumSq += static_cast<long double>(s * s);
  }
  const size_t n = samples.size();
  const double rms = (n > 0) ? std::sqrt(static_cast<double>(sumSq / static_cast<long double>(n))) : 0.0;
  auto toDb = [](double x) -> double { return (x > 0.0) ? (20.0 * std::log10(x)) : -std::numeric_limits<double>::infinity(); };
  outPeakDb = toDb(peak);
  outRmsDb = toDb(rms);
}

static void printUsage(const char* exe) {
  std::fprintf(stderr,
               "Usage: %s [--patch path.json] [--duration sec] [--block N] [--sr Hz] [--cps X] [--seed N]\n"
               "          [--meters] [--live path.json] [--quit-after sec]\n"
               "          [--validate path.json] [--list-nodes path.json] [--list-node-types]\n"
               "          [--print-plan path.json] [--export-mermaid path.json]\n"
               "\nOffline render:\n"
               "  --patch PATH       Compile the patch and render it as fast as possible\n"
               "  --duration SEC     Length of the offline render (default 4)\n"
               "  --block N          Frames per render call (default: patch maxBlock)\n"
               "  --sr HZ            Override the patch sample rate (min 8000)\n"
               "  --cps X            Override the patch tempo in cycles per second\n"
               "  --seed N           Override the patch randomSeed (0 to skip)\n"
               "  --meters           Print per-meter peak/RMS after an offline render\n"
               "\nLive:\n"
               "  --live PATH        Play the patch with wall-clock timing; edits to the file are hot-swapped;\n"
               "                     removing the file hushes output until it returns\n"
               "  --quit-after SEC   Stop the live run after SEC seconds (default: run until Ctrl-C)\n"
               "  --poll-ms N        Patch file poll interval (default 250)\n"
               "\nInspection:\n"
               "  --validate PATH        Compile the patch and report construction errors\n"
               "  --list-nodes PATH      List the nodes declared by a patch\n"
               "  --list-node-types      List the node types the factory can build\n"
               "  --print-plan PATH      Print the evaluation order and feedback edges\n"
               "  --export-mermaid PATH  Print the graph as a Mermaid flowchart to stdout\n"
               "\nProgress (offline):\n"
               "  --progress-ms N    Progress print interval in ms (0=disable)\n"
               "  --no-progress      Disable progress prints\n"
               "  --no-summary       Disable final speedup summary\n"
               "\n"
               "Examples:\n"
               "  %s --patch comb_pluck.json --duration 2\n"
               "  %s --live feedback_delay.json --quit-after 30\n",
               exe, exe, exe);
}

static int listNodeTypes() {
  std::printf("Node types (%zu):\n", nodeTypeCatalogue().size());
  for (const auto& t : nodeTypeCatalogue()) {
    std::printf("- %-11s %s%s\n", t.type, t.summary, t.providesDelay ? " [delay]" : "");
    std::printf("    params:");
    for (const char* k : t.keys) std::printf(" %s", k);
    std::printf("\n");
  }
  return 0;
}

static int listNodesPatch(const std::string& path) {
  try {
    PatchSpec spec = loadPatchSpecFromJsonFile(path);
    std::printf("Nodes (%zu):\n", spec.nodes.size());
    for (const auto& n : spec.nodes) {
      std::printf("- id=%s type=%s\n", n.id.c_str(), n.type.c_str());
    }
    std::printf("Output: %s\n", spec.output.c_str());
    if (spec.hasCps) std::printf("Cps: %.4f\n", spec.cps);
    return 0;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Failed to load patch JSON: %s\n", e.what());
    return 1;
  }
}

static int validatePatch(const std::string& path, const CompileOptions& opts) {
  try {
    PatchSpec spec = loadPatchSpecFromJsonFile(path);
    auto graph = compilePatch(spec, opts);
    const auto& fa = graph->analysis();
    size_t cyclic = 0;
    for (bool c : fa.cyclic) cyclic += c ? 1 : 0;
    std::printf("OK: %s (%zu nodes, %zu feedback loops, %zu feedback edges)\n",
                spec.origin.c_str(), graph->nodeCount(), cyclic, fa.feedbackEdges.size());
    return 0;
  } catch (const GraphBuildError& e) {
    std::fprintf(stderr, "Invalid patch [%s]: %s\n", graphBuildErrorKindName(e.kind()), e.what());
    return 2;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Invalid patch: %s\n", e.what());
    return 1;
  }
}

static void printMeters(Graph& graph) {
  graph.forEachNode([](NodeId id, const std::string& label, Node& n) {
    if (auto* m = dynamic_cast<MeterNode*>(&n)) {
      auto toDb = [](double x) { return (x > 0.0) ? 20.0 * std::log10(x) : -120.0; };
      std::fprintf(stderr, "[meter] %s (#%u): peak %.1f dBFS, max %.1f dBFS, rms %.1f dBFS over %llu blocks\n",
                   label.c_str(), id, toDb(m->peak()), toDb(m->maxPeak()), toDb(m->rms()),
                   static_cast<unsigned long long>(m->blocks()));
    }
  });
}

static std::filesystem::file_time_type patchMtime(const std::string& path) {
  std::error_code ec;
  const auto t = std::filesystem::last_write_time(path, ec);
  return ec ? std::filesystem::file_time_type::min() : t;
}

// Compile failures leave the current graph playing.
static std::unique_ptr<Graph> tryCompileLive(const std::string& path, const CompileOptions& opts) {
  try {
    PatchSpec spec = loadPatchSpecFromJsonFile(path);
    auto graph = compilePatch(spec, opts);
    graph->enableWallClockTiming();
    return graph;
  } catch (const GraphBuildError& e) {
    std::fprintf(stderr, "[live] rejected edit [%s]: %s\n", graphBuildErrorKindName(e.kind()), e.what());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[live] rejected edit: %s\n", e.what());
  }
  return nullptr;
}

static int runLive(const std::string& path, const CompileOptions& opts, uint32_t block,
                   double quitAfterSec, int pollMs) {
  const std::string resolved = resolvePatchPath(path);
  if (resolved.empty()) {
    std::fprintf(stderr, "Patch not found: %s\n", path.c_str());
    return 1;
  }
  auto first = tryCompileLive(resolved, opts);
  if (!first) return 1;
  const double sampleRate = first->sampleRate();
  const uint32_t frames = block ? block : first->maxBlock();

  LiveSession session;
  session.install(std::move(first));

  std::atomic<double> blockPeak{0.0};
  RealtimeGraphRenderer renderer;
  renderer.setSink([&blockPeak](const float* s, uint32_t n) {
    double p = 0.0;
    for (uint32_t i = 0; i < n; ++i) p = std::max(p, static_cast<double>(std::fabs(s[i])));
    blockPeak.store(p, std::memory_order_relaxed);
  });
  renderer.start(session, sampleRate, frames);
  std::fprintf(stderr, "[live] playing %s at %.0f Hz, %u frames per buffer (Ctrl-C to stop)\n",
               resolved.c_str(), sampleRate, frames);

  auto lastMtime = patchMtime(resolved);
  const auto tStart = std::chrono::steady_clock::now();
  auto lastStatus = tStart;
  while (gRunning.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(pollMs));
    const auto now = std::chrono::steady_clock::now();
    const double elapsed = std::chrono::duration<double>(now - tStart).count();
    if (quitAfterSec > 0.0 && elapsed >= quitAfterSec) break;

    const auto mt = patchMtime(resolved);
    if (mt != lastMtime) {
      lastMtime = mt;
      if (mt == std::filesystem::file_time_type::min()) {
        // deleted or renamed away: go silent until the file comes back
        if (session.hush()) std::fprintf(stderr, "\n[live] patch file gone; output hushed\n");
      } else if (auto next = tryCompileLive(resolved, opts)) {
        if (next->sampleRate() != sampleRate) {
          std::fprintf(stderr, "[live] Warning: sampleRate change ignored until restart (%.0f Hz)\n", sampleRate);
        } else {
          session.install(std::move(next));
        }
      }
    }
    session.collectRetired();

    if (std::chrono::duration<double>(now - lastStatus).count() >= 1.0) {
      lastStatus = now;
      std::fprintf(stderr, "[live] %s  cycle %.3f  cps %.3f  peak %.3f  swaps %llu  late %llu\r",
                   formatDuration(elapsed).c_str(), session.cyclePosition(), session.activeCps(),
                   blockPeak.load(std::memory_order_relaxed),
                   static_cast<unsigned long long>(session.swapCount()),
                   static_cast<unsigned long long>(renderer.lateBuffers()));
    }
  }
  renderer.stop();
  std::fprintf(stderr, "\n[live] stopped after %llu buffers (%llu late, %llu swaps, %llu timing fallbacks)\n",
               static_cast<unsigned long long>(renderer.buffersRendered()),
               static_cast<unsigned long long>(renderer.lateBuffers()),
               static_cast<unsigned long long>(session.swapCount()),
               static_cast<unsigned long long>(session.fallbackCount()));
  return 0;
}

static int runOffline(const std::string& path, const CompileOptions& opts, uint32_t block, double durationSec, bool meters) {
  PatchSpec spec = loadPatchSpecFromJsonFile(path);
  if (!spec.description.empty()) std::fprintf(stderr, "[patch] %s\n", spec.description.c_str());
  auto graph = compilePatch(spec, opts);
  const uint64_t frames = static_cast<uint64_t>(std::llround(durationSec * graph->sampleRate()));
  const uint32_t n = block ? block : graph->maxBlock();
  std::fprintf(stderr, "[offline] %s: %zu nodes, %.0f Hz, block %u, cps %.3f, %s\n",
               spec.origin.c_str(), graph->nodeCount(), graph->sampleRate(), n, graph->getCps(),
               formatDuration(durationSec).c_str());
  const std::vector<float> out = renderGraphMono(*graph, frames, n);

  double peakDb = 0.0, rmsDb = 0.0;
  size_t nonFinite = 0;
  computePeakAndRms(out, peakDb, rmsDb, nonFinite);
  std::printf("peak %.2f dBFS, rms %.2f dBFS, %llu frames, final cycle %.4f\n", peakDb, rmsDb,
              static_cast<unsigned long long>(frames), graph->getCyclePosition());
  if (meters) printMeters(*graph);
  if (nonFinite > 0) {
    std::fprintf(stderr, "[offline] Warning: %zu non-finite samples in output\n", nonFinite);
    return 3;
  }
  return 0;
}

int main(int argc, char** argv) {
  std::signal(SIGINT, onSigInt);

  std::string patchPath;
  std::string livePath;
  std::string validatePath;
  std::string listNodesPath;
  std::string printPlanPath;
  std::string exportMermaidPath;
  bool listTypes = false;
  bool meters = false;
  double durationSec = 4.0;
  double quitAfterSec = 0.0;
  uint32_t block = 0;
  int pollMs = 250;
  CompileOptions opts;

  {
    static const char* kCyclegraphVersion = "0.1.0";
    std::fprintf(stderr, "cyclegraph -- version %s starting up (built %s %s)\n", kCyclegraphVersion, __DATE__, __TIME__);
  }
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto need = [&](int remain) {
      if (i + remain >= argc) {
        printUsage(argv[0]);
        std::exit(1);
      }
    };
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (std::strcmp(a, "--patch") == 0) {
      need(1); patchPath = argv[++i];
    } else if (std::strcmp(a, "--live") == 0) {
      need(1); livePath = argv[++i];
    } else if (std::strcmp(a, "--duration") == 0) {
      need(1); durationSec = std::max(0.0, std::atof(argv[++i]));
    } else if (std::strcmp(a, "--block") == 0) {
      need(1); block = static_cast<uint32_t>(std::max(0, std::atoi(argv[++i])));
    } else if (std::strcmp(a, "--sr") == 0) {
      need(1); opts.sampleRate = static_cast<uint32_t>(std::max(8000, std::atoi(argv[++i])));
    } else if (std::strcmp(a, "--cps") == 0) {
      need(1); opts.cps = std::atof(argv[++i]);
      if (!(opts.cps > 0.0)) { std::fprintf(stderr, "--cps must be > 0\n"); return 1; }
    } else if (std::strcmp(a, "--seed") == 0) {
      need(1); opts.randomSeed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(a, "--meters") == 0) {
      meters = true;
    } else if (std::strcmp(a, "--quit-after") == 0) {
      need(1); quitAfterSec = std::atof(argv[++i]);
    } else if (std::strcmp(a, "--poll-ms") == 0) {
      need(1); pollMs = std::max(10, std::atoi(argv[++i]));
    } else if (std::strcmp(a, "--progress-ms") == 0) {
      need(1); gOfflineProgressMs = std::atoi(argv[++i]);
    } else if (std::strcmp(a, "--no-progress") == 0) {
      gOfflineProgressEnabled = false;
    } else if (std::strcmp(a, "--no-summary") == 0) {
      gOfflineSummaryEnabled = false;
    } else if (std::strcmp(a, "--validate") == 0) {
      need(1); validatePath = argv[++i];
    } else if (std::strcmp(a, "--list-nodes") == 0) {
      need(1); listNodesPath = argv[++i];
    } else if (std::strcmp(a, "--list-node-types") == 0) {
      listTypes = true;
    } else if (std::strcmp(a, "--print-plan") == 0) {
      need(1); printPlanPath = argv[++i];
    } else if (std::strcmp(a, "--export-mermaid") == 0) {
      need(1); exportMermaidPath = argv[++i];
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a);
      printUsage(argv[0]);
      return 1;
    }
  }

  try {
    if (listTypes) return listNodeTypes();
    if (!listNodesPath.empty()) return listNodesPatch(listNodesPath);
    if (!validatePath.empty()) return validatePatch(validatePath, opts);
    if (!printPlanPath.empty()) {
      auto graph = compilePatch(loadPatchSpecFromJsonFile(printPlanPath), opts);
      printEvaluationPlan(*graph);
      return 0;
    }
    if (!exportMermaidPath.empty()) {
      auto graph = compilePatch(loadPatchSpecFromJsonFile(exportMermaidPath), opts);
      const std::string mmd = exportMermaidFromGraph(*graph);
      std::fwrite(mmd.data(), 1, mmd.size(), stdout);
      return 0;
    }
    if (!livePath.empty()) return runLive(livePath, opts, block, quitAfterSec, pollMs);
    if (!patchPath.empty()) return runOffline(patchPath, opts, block, durationSec, meters);
  } catch (const GraphBuildError& e) {
    std::fprintf(stderr, "Graph build failed [%s]: %s\n", graphBuildErrorKindName(e.kind()), e.what());
    return 2;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Error: %s\n", e.what());
    return 1;
  }

  printUsage(argv[0]);
  return 1;
}
