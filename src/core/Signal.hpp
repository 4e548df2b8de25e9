#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <algorithm>
#include <cmath>

// Dense per-graph node handle. Assigned on insertion, never reused within one Graph.
using NodeId = uint32_t;
inline constexpr NodeId kInvalidNodeId = 0xFFFFFFFFu;

enum class SignalOp : uint8_t { Add, Sub, Mul, Div, Mod, Scale };

struct SignalExpr;

// Parameter input of a node: a literal, another node's output, or arithmetic over signals.
class Signal {
public:
  enum class Kind : uint8_t { Constant, NodeRef, Expression };

  Signal() = default;
  Signal(float value) : value_(value) {}

  static Signal constant(float value) { return Signal(value); }
  static Signal ref(NodeId id) {
    Signal s; s.kind_ = Kind::NodeRef; s.node_ = id; return s;
  }
  // Left fold of args with op (Add/Sub/Mul/Div/Mod).
  static Signal expr(SignalOp op, std::vector<Signal> args);
  // Maps a unipolar 0..1 input onto [min, max].
  static Signal scale(Signal input, float min, float max);

  Kind kind() const { return kind_; }
  bool isConstant() const { return kind_ == Kind::Constant; }
  bool isNodeRef() const { return kind_ == Kind::NodeRef; }
  bool isExpression() const { return kind_ == Kind::Expression; }

  float value() const { return value_; }
  NodeId nodeId() const { return node_; }
  const SignalExpr& expression() const { return *expr_; }

  // Appends every NodeId referenced anywhere in this signal (may contain duplicates).
  void collectNodeIds(std::vector<NodeId>& out) const;
  // Expression nesting depth (0 for constants and node refs).
  uint32_t depth() const;

private:
  Kind kind_ = Kind::Constant;
  float value_ = 0.0f;
  NodeId node_ = kInvalidNodeId;
  std::shared_ptr<const SignalExpr> expr_;
};

struct SignalExpr {
  SignalOp op = SignalOp::Add;
  std::vector<Signal> args;
  float min = 0.0f; // Scale only
  float max = 1.0f; // Scale only
};

inline Signal Signal::expr(SignalOp op, std::vector<Signal> args) {
  auto e = std::make_shared<SignalExpr>();
  e->op = op;
  e->args = std::move(args);
  Signal s; s.kind_ = Kind::Expression; s.expr_ = std::move(e);
  return s;
}

inline Signal Signal::scale(Signal input, float min, float max) {
  auto e = std::make_shared<SignalExpr>();
  e->op = SignalOp::Scale;
  e->args.push_back(std::move(input));
  e->min = min; e->max = max;
  Signal s; s.kind_ = Kind::Expression; s.expr_ = std::move(e);
  return s;
}

inline void Signal::collectNodeIds(std::vector<NodeId>& out) const {
  if (kind_ == Kind::NodeRef) { out.push_back(node_); return; }
  if (kind_ == Kind::Expression) {
    for (const auto& a : expr_->args) a.collectNodeIds(out);
  }
}

inline uint32_t Signal::depth() const {
  if (kind_ != Kind::Expression) return 0;
  uint32_t d = 0;
  for (const auto& a : expr_->args) d = std::max(d, a.depth());
  return d + 1;
}

inline Signal operator+(Signal a, Signal b) { return Signal::expr(SignalOp::Add, {std::move(a), std::move(b)}); }
inline Signal operator-(Signal a, Signal b) { return Signal::expr(SignalOp::Sub, {std::move(a), std::move(b)}); }
inline Signal operator*(Signal a, Signal b) { return Signal::expr(SignalOp::Mul, {std::move(a), std::move(b)}); }
inline Signal operator/(Signal a, Signal b) { return Signal::expr(SignalOp::Div, {std::move(a), std::move(b)}); }
inline Signal operator%(Signal a, Signal b) { return Signal::expr(SignalOp::Mod, {std::move(a), std::move(b)}); }

// Sample-wise combine used by the evaluator. Division and modulo by zero give 0.
inline float applySignalOp(SignalOp op, float a, float b) {
  switch (op) {
    case SignalOp::Add: return a + b;
    case SignalOp::Sub: return a - b;
    case SignalOp::Mul: return a * b;
    case SignalOp::Div: return (b != 0.0f) ? a / b : 0.0f;
    case SignalOp::Mod: return (b != 0.0f) ? std::fmod(a, b) : 0.0f;
    case SignalOp::Scale: return a;
  }
  return a;
}
