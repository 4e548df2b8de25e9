#include "Evaluator.hpp"
#include <algorithm>
#include <cstring>

void Evaluator::build(const std::vector<Node*>& nodes, const std::vector<std::string>& labels, uint32_t maxBlock) {
  nodes_ = nodes;
  maxBlock_ = std::max<uint32_t>(1, maxBlock);
  const size_t n = nodes_.size();

  std::vector<std::vector<NodeId>> deps(n);
  delay_.assign(n, false);
  for (size_t i = 0; i < n; ++i) {
    deps[i] = nodes_[i]->inputNodeIds();
    delay_[i] = nodes_[i]->providesDelay();
  }
  analysis_ = analyzeFeedback(deps, delay_, labels);

  pool_.releaseAll();
  pool_.setFrames(maxBlock_);
  out_.assign(n, nullptr);
  lastOut_.assign(n, nullptr);
  for (size_t i = 0; i < n; ++i) {
    out_[i] = pool_.acquire();
    lastOut_[i] = pool_.acquireCell();
  }

  uint32_t maxDepth = 0;
  slots_.assign(n, {});
  argv_.assign(n, {});
  for (NodeId v = 0; v < n; ++v) {
    const auto& inputs = nodes_[v]->inputs();
    auto& slots = slots_[v];
    slots.resize(inputs.size());
    argv_[v].assign(inputs.size(), nullptr);
    for (size_t k = 0; k < inputs.size(); ++k) {
      const Signal& s = inputs[k];
      InputSlot& slot = slots[k];
      switch (s.kind()) {
        case Signal::Kind::Constant:
          slot.base = pool_.acquire(s.value());
          break;
        case Signal::Kind::NodeRef:
          if (isFeedback(s.nodeId(), v)) { slot.base = lastOut_[s.nodeId()]; slot.stride = 0; }
          else slot.base = out_[s.nodeId()];
          break;
        case Signal::Kind::Expression:
          slot.scratch = pool_.acquire();
          slot.base = slot.scratch;
          slot.expr = &s;
          maxDepth = std::max(maxDepth, s.depth());
          break;
      }
    }
  }
  exprTmp_.clear();
  for (uint32_t d = 0; d < maxDepth; ++d) exprTmp_.push_back(pool_.acquire());

  states_.assign(n, static_cast<uint8_t>(NodeState::Uninitialized));
  stamp_.assign(analysis_.components.size(), 0u);
  currentStamp_ = 0;
}

void Evaluator::run(ProcessContext ctx, NodeId root) {
  if (ctx.frames == 0) return;
  ++currentStamp_;
  evaluateComponent(analysis_.componentOf[root], ctx);
}

void Evaluator::evaluateComponent(uint32_t c, const ProcessContext& ctx) {
  if (stamp_[c] == currentStamp_) return;
  stamp_[c] = currentStamp_;
  for (uint32_t up : analysis_.upstream[c]) evaluateComponent(up, ctx);
  if (analysis_.cyclic[c]) processPerSample(c, ctx);
  else processBlock(analysis_.components[c].front(), ctx);
}

void Evaluator::processBlock(NodeId v, const ProcessContext& ctx) {
  auto& slots = slots_[v];
  auto& argv = argv_[v];
  for (size_t k = 0; k < slots.size(); ++k) {
    if (slots[k].expr) resolveSignal(*slots[k].expr, v, slots[k].scratch, 0, ctx.frames, 0);
    argv[k] = slots[k].base;
  }
  nodes_[v]->process(ctx, argv.data(), out_[v]);
  *lastOut_[v] = out_[v][ctx.frames - 1];
  states_[v] = static_cast<uint8_t>(NodeState::Steady);
}

void Evaluator::processPerSample(uint32_t c, const ProcessContext& ctx) {
  const auto& members = analysis_.components[c];
  const double step = (ctx.cycleEnd - ctx.cycleBegin) / static_cast<double>(ctx.frames);
  ProcessContext sc = ctx;
  sc.frames = 1;
  for (uint32_t i = 0; i < ctx.frames; ++i) {
    sc.blockStart = ctx.blockStart + i;
    sc.cycleBegin = ctx.cycleBegin + step * static_cast<double>(i);
    sc.cycleEnd = sc.cycleBegin + step;
    for (NodeId v : members) {
      auto& slots = slots_[v];
      auto& argv = argv_[v];
      for (size_t k = 0; k < slots.size(); ++k) {
        const InputSlot& slot = slots[k];
        if (slot.expr) {
          resolveSignal(*slot.expr, v, slot.scratch + i, i, 1, 0);
          argv[k] = slot.scratch + i;
        } else {
          argv[k] = slot.base + static_cast<size_t>(i) * slot.stride;
        }
      }
      nodes_[v]->process(sc, argv.data(), out_[v] + i);
    }
    // Feedback edges observe these values on the next sample.
    for (NodeId v : members) *lastOut_[v] = out_[v][i];
  }
  for (NodeId v : members) states_[v] = static_cast<uint8_t>(NodeState::Steady);
}

void Evaluator::resolveSignal(const Signal& s, NodeId consumer, float* dst, uint32_t offset, uint32_t n, uint32_t depth) {
  switch (s.kind()) {
    case Signal::Kind::Constant:
      std::fill(dst, dst + n, s.value());
      return;
    case Signal::Kind::NodeRef: {
      const NodeId u = s.nodeId();
      if (isFeedback(u, consumer)) std::fill(dst, dst + n, *lastOut_[u]);
      else std::memcpy(dst, out_[u] + offset, sizeof(float) * n);
      return;
    }
    case Signal::Kind::Expression:
      break;
  }
  const SignalExpr& e = s.expression();
  if (e.args.empty()) { std::fill(dst, dst + n, 0.0f); return; }
  resolveSignal(e.args[0], consumer, dst, offset, n, depth + 1);
  if (e.op == SignalOp::Scale) {
    const float span = e.max - e.min;
    for (uint32_t i = 0; i < n; ++i) dst[i] = e.min + dst[i] * span;
    return;
  }
  float* tmp = exprTmp_[depth];
  for (size_t k = 1; k < e.args.size(); ++k) {
    resolveSignal(e.args[k], consumer, tmp, offset, n, depth + 1);
    for (uint32_t i = 0; i < n; ++i) dst[i] = applySignalOp(e.op, dst[i], tmp[i]);
  }
}
