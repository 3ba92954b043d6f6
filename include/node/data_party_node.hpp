#pragma once
#include "core/local_party.hpp"
#include "model/data_partition.hpp"
#include "node/node_state.hpp"
#include "node/party_config.hpp"
#include "protocol/messages.hpp"
#include "utils/connection_registry.hpp"
#include "utils/error_codes.hpp"
#include <httplib.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// A data party process: holds its columns, answers the coordinator's
// Initiation, takes part in every ring pass by adding its contribution and
// forwarding synchronously to its successor, and follows split decisions.
class DataPartyNode {
public:
  DataPartyNode(const std::string &node_id, int listen_port,
                Dataset local_columns,
                const PartyConfig &config = PartyConfig());
  ~DataPartyNode();

  // Binds the listener (port 0 picks a free port) and serves in the
  // background
  vertree::Result<void> start();
  vertree::Result<void> connectToCoordinator(const std::string &host,
                                             int port);
  void stop();

  const std::string &getNodeId() const { return node_id_; }
  int getListenPort() const { return listen_port_; }
  NodeState state() const { return lifecycle_.state(); }
  bool running() const { return lifecycle_.running(); }
  const LocalParty &party() const { return party_; }

private:
  void setupRoutes();
  void handleEndpointStatus(const httplib::Request &, httplib::Response &);
  void handleEndpointMessage(const httplib::Request &, httplib::Response &);

  Message handleInitiation(const Message &message,
                           const InitiationPayload &initiation);
  Message handleCountRound(const Message &message,
                           const CountRoundPayload &round);
  Message handleSplitDecision(const Message &message,
                              const SplitDecisionPayload &split);
  Message handleTreeComplete(const Message &message,
                             const TreeCompletePayload &complete);
  Message replyError(const Message &message, vertree::ErrorCode code,
                     const std::string &detail,
                     const std::string &tree_node_id = "");

  // Identity and configuration
  std::string node_id_;
  int listen_port_;
  PartyConfig config_;

  LocalParty party_;
  NodeLifecycle lifecycle_;

  // Listener
  httplib::Server svr_;
  std::thread listener_thread_;

  // Session: ring addresses (coordinator last) and our place in it
  std::vector<NodeAddress> ring_;
  std::string coordinator_id_;
  std::mutex session_mutex_;

  ConnectionRegistry registry_;
};
