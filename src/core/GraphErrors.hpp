#pragma once

#include <stdexcept>
#include <string>

// Construction errors are raised while a graph is built or sealed, never while it renders.
class GraphBuildError : public std::runtime_error {
public:
  enum class Kind {
    DanglingNodeRef,      // a Signal references a NodeId (or patch id) that does not exist
    EmptyNodeSlot,        // a reserved NodeId was never filled
    MissingOutput,        // no output node designated
    FeedbackWithoutDelay  // a cycle with no delay-providing node on it
  };

  GraphBuildError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

inline const char* graphBuildErrorKindName(GraphBuildError::Kind k) {
  switch (k) {
    case GraphBuildError::Kind::DanglingNodeRef: return "dangling-node-ref";
    case GraphBuildError::Kind::EmptyNodeSlot: return "empty-node-slot";
    case GraphBuildError::Kind::MissingOutput: return "missing-output";
    case GraphBuildError::Kind::FeedbackWithoutDelay: return "feedback-without-delay";
  }
  return "unknown";
}
