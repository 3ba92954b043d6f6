#pragma once
#include "core/party_network.hpp"
#include "core/tree_builder.hpp"
#include "core/tree_config.hpp"
#include "model/tree_node.hpp"
#include "mpc/secure_sum.hpp"
#include "node/coordinator_config.hpp"
#include "node/node_state.hpp"
#include "protocol/messages.hpp"
#include "utils/connection_registry.hpp"
#include "utils/error_codes.hpp"
#include <atomic>
#include <condition_variable>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// The coordinator process. Parties register over /connect (or are listed in
// the config); once every party named in the attribute partitioning is
// registered and answers its probe, the coordinator broadcasts the
// Initiation, grows the tree through ring passes it initiates and finalizes
// itself, and closes the session with TreeComplete.
class CoordinatorNode : public PartyNetwork {
public:
  explicit CoordinatorNode(const CoordinatorConfig &config);
  ~CoordinatorNode() override;

  // Binds the listener (port 0 picks a free port) and serves in the
  // background
  vertree::Result<void> start();
  void stop();

  // Waits for registrations, then probes each ring member with retries
  vertree::Result<void> awaitParties();
  vertree::Result<void> initiate();
  vertree::Result<std::unique_ptr<TreeNode>> buildTree();

  // awaitParties, initiate and buildTree in sequence
  vertree::Result<std::unique_ptr<TreeNode>> run();

  // PartyNetwork
  const GlobalSchema &schema() const override { return schema_; }
  vertree::Result<NodeStatistics>
  nodeStatistics(const std::string &tree_node_id) override;
  vertree::Result<CountMatrix> attributeCounts(const std::string &tree_node_id,
                                               int attribute_index) override;
  vertree::Result<void>
  splitNode(const std::string &tree_node_id, int attribute_index,
            const std::vector<std::string> &child_node_ids) override;
  uint64_t secureSumsRun() const override { return sums_run_.load(); }

  const std::string &getNodeId() const { return config_.node_id; }
  int getListenPort() const { return listen_port_; }
  NodeState state() const { return lifecycle_.state(); }
  const BuildReport &report() const { return report_; }
  const std::string &sessionId() const { return session_id_; }
  std::vector<NodeAddress> registeredParties() const;

private:
  void setupRoutes();
  void handleEndpointStatus(const httplib::Request &, httplib::Response &);
  void handleEndpointConnect(const httplib::Request &, httplib::Response &);
  void handleEndpointMessage(const httplib::Request &, httplib::Response &);

  void registerParty(const NodeAddress &party);
  vertree::Result<std::vector<std::string>> ringOrder() const;
  vertree::Result<std::vector<uint64_t>> ringPass(CountRoundPayload round,
                                                  size_t slots);
  vertree::Result<Message> send(const std::string &party_id,
                                MessagePayload payload);
  void broadcastTreeComplete(uint64_t node_count);

  // Configuration
  CoordinatorConfig config_;
  TreeConfig tree_config_;
  int listen_port_;

  NodeLifecycle lifecycle_;

  // Listener
  httplib::Server svr_;
  std::thread listener_thread_;

  // Registered parties in arrival order
  std::vector<NodeAddress> roster_;
  mutable std::mutex roster_mutex_;
  std::condition_variable roster_cv_;

  // Session
  std::vector<NodeAddress> ring_; // parties only, in ring order
  std::string session_id_;
  std::unique_ptr<SecureSum> secure_sum_;
  GlobalSchema schema_;
  std::atomic<uint64_t> sums_run_{0};
  BuildReport report_;

  // Ring passes waiting for the last party to hand the state back
  std::unordered_map<std::string, std::optional<SecureSumState>> open_sums_;
  std::mutex open_sums_mutex_;

  ConnectionRegistry registry_;
};
