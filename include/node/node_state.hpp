#pragma once
#include "utils/error_codes.hpp"
#include <atomic>
#include <string>

enum class NodeState {
  Created,
  Listening,
  Connecting,
  ConnectedToAllParties, // coordinator only
  RoundActive,
  TreeComplete,
  Stopped,
  Failed
};

const char *nodeStateToString(NodeState state);

bool isValidTransition(NodeState from, NodeState to);

// Lifecycle of one node process. Transitions are checked against the
// allowed graph; Stopped is terminal and reachable from every live state.
class NodeLifecycle {
public:
  NodeState state() const { return state_.load(); }
  bool running() const;

  vertree::Result<void> transition(NodeState to);

  // Moves to `to` only if the node is still in `expected`
  bool transitionFrom(NodeState expected, NodeState to);

  // Failed unless already Stopped
  void fail();

private:
  std::atomic<NodeState> state_{NodeState::Created};
};
