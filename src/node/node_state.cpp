#include "node/node_state.hpp"
#include "utils/logging.hpp"

using vertree::ErrorCode;
using vertree::Result;

const char *nodeStateToString(NodeState state) {
  switch (state) {
  case NodeState::Created: return "CREATED";
  case NodeState::Listening: return "LISTENING";
  case NodeState::Connecting: return "CONNECTING";
  case NodeState::ConnectedToAllParties: return "CONNECTED_TO_ALL_PARTIES";
  case NodeState::RoundActive: return "ROUND_ACTIVE";
  case NodeState::TreeComplete: return "TREE_COMPLETE";
  case NodeState::Stopped: return "STOPPED";
  case NodeState::Failed: return "FAILED";
  }
  return "UNKNOWN";
}

bool isValidTransition(NodeState from, NodeState to) {
  if (from == NodeState::Stopped) {
    return false;
  }
  if (to == NodeState::Stopped) {
    return true;
  }

  switch (from) {
  case NodeState::Created:
    return to == NodeState::Listening;
  case NodeState::Listening:
    // A party goes straight to RoundActive when the Initiation arrives
    return to == NodeState::Connecting || to == NodeState::RoundActive;
  case NodeState::Connecting:
    // A party's Initiation can overtake the reply to its registration
    return to == NodeState::ConnectedToAllParties ||
           to == NodeState::Listening || to == NodeState::RoundActive ||
           to == NodeState::Failed;
  case NodeState::ConnectedToAllParties:
    return to == NodeState::RoundActive || to == NodeState::Failed;
  case NodeState::RoundActive:
    return to == NodeState::RoundActive || to == NodeState::TreeComplete ||
           to == NodeState::Failed;
  case NodeState::TreeComplete:
    // Parties accept a fresh Initiation for the next session
    return to == NodeState::RoundActive;
  case NodeState::Failed:
  case NodeState::Stopped:
    return false;
  }
  return false;
}

bool NodeLifecycle::running() const {
  NodeState current = state_.load();
  return current != NodeState::Created && current != NodeState::Stopped &&
         current != NodeState::Failed;
}

Result<void> NodeLifecycle::transition(NodeState to) {
  NodeState current = state_.load();
  while (true) {
    if (!isValidTransition(current, to)) {
      return Result<void>(ErrorCode::SystemInvalidState,
                          std::string(nodeStateToString(current)) + " -> " +
                              nodeStateToString(to));
    }
    if (state_.compare_exchange_weak(current, to)) {
      DEBUG_DEBUG("Node state " << nodeStateToString(current) << " -> "
                                << nodeStateToString(to));
      return Result<void>();
    }
  }
}

bool NodeLifecycle::transitionFrom(NodeState expected, NodeState to) {
  if (!isValidTransition(expected, to)) {
    return false;
  }
  return state_.compare_exchange_strong(expected, to);
}

void NodeLifecycle::fail() {
  NodeState current = state_.load();
  while (current != NodeState::Stopped && current != NodeState::Failed) {
    if (state_.compare_exchange_weak(current, NodeState::Failed)) {
      return;
    }
  }
}
