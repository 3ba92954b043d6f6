#include "node/coordinator_node.hpp"
#include "core/global_schema.hpp"
#include "io/model_file.hpp"
#include "model/data_partition.hpp"
#include "node/node_transport.hpp"
#include "protocol/parser.hpp"
#include "utils/ids.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>

using vertree::ErrorCode;
using vertree::Result;

CoordinatorNode::CoordinatorNode(const CoordinatorConfig &config)
    : config_(config), listen_port_(config.port) {
  registry_.setTimeouts(config_.socket_timeout_seconds,
                        config_.socket_timeout_seconds);
  svr_.set_read_timeout(config_.socket_timeout_seconds, 0);
  svr_.set_write_timeout(config_.socket_timeout_seconds, 0);
  setupRoutes();

  for (const auto &party : config_.parties) {
    registerParty(party);
  }

  LOG("Coordinator " << config_.node_id << " initialized for dataset "
                     << config_.dataset_name);
}

CoordinatorNode::~CoordinatorNode() { stop(); }

Result<void> CoordinatorNode::start() {
  if (listen_port_ == 0) {
    listen_port_ = svr_.bind_to_any_port(config_.host);
  } else if (!svr_.bind_to_port(config_.host, listen_port_)) {
    listen_port_ = -1;
  }
  if (listen_port_ < 0) {
    lifecycle_.fail();
    return Result<void>(ErrorCode::NetworkBindFailed,
                        config_.host + ":" + std::to_string(config_.port));
  }

  if (auto listening = lifecycle_.transition(NodeState::Listening);
      listening.isError()) {
    svr_.stop();
    return listening;
  }

  listener_thread_ = std::thread([this]() {
    DEBUG_INFO("Coordinator listener thread started");
    svr_.listen_after_bind();
  });
  LOG("Starting coordinator on http://" << config_.host << ":" << listen_port_);
  return Result<void>();
}

void CoordinatorNode::stop() {
  if (lifecycle_.state() != NodeState::Stopped &&
      lifecycle_.transition(NodeState::Stopped).isSuccess()) {
    LOG("Stopping coordinator " << config_.node_id);
  }
  roster_cv_.notify_all();
  svr_.stop();
  if (listener_thread_.joinable()) {
    listener_thread_.join();
  }
  registry_.closeAll();
}

void CoordinatorNode::setupRoutes() {
  svr_.Get("/status",
           [this](const httplib::Request &req, httplib::Response &res) {
             this->handleEndpointStatus(req, res);
           });

  svr_.Post("/connect",
            [this](const httplib::Request &req, httplib::Response &res) {
              DEBUG_INFO("CONNECT: Received data: " << req.body);
              this->handleEndpointConnect(req, res);
            });

  svr_.Post("/message",
            [this](const httplib::Request &req, httplib::Response &res) {
              DEBUG_DEBUG("MESSAGE: Received data: " << req.body);
              this->handleEndpointMessage(req, res);
            });
}

void CoordinatorNode::handleEndpointStatus(const httplib::Request &,
                                           httplib::Response &res) {
  nlohmann::json status = {{"node_id", config_.node_id},
                           {"state", nodeStateToString(lifecycle_.state())},
                           {"parties", registeredParties().size()}};
  res.status = 200;
  res.set_content(status.dump(), "application/json");
}

void CoordinatorNode::registerParty(const NodeAddress &party) {
  std::lock_guard<std::mutex> lock(roster_mutex_);
  auto existing = std::find_if(
      roster_.begin(), roster_.end(),
      [&](const NodeAddress &entry) { return entry.node_id == party.node_id; });
  if (existing != roster_.end()) {
    *existing = party;
  } else {
    roster_.push_back(party);
  }
  DEBUG_DEBUG("Roster size after adding: " << roster_.size());
  roster_cv_.notify_all();
}

std::vector<NodeAddress> CoordinatorNode::registeredParties() const {
  std::lock_guard<std::mutex> lock(roster_mutex_);
  return roster_;
}

void CoordinatorNode::handleEndpointConnect(const httplib::Request &req,
                                            httplib::Response &res) {
  NodeState current = lifecycle_.state();
  if (current != NodeState::Listening && current != NodeState::Connecting) {
    res.status = 409;
    res.set_content("{\"error\":\"Registration closed\"}", "application/json");
    return;
  }

  if (auto request = parseConnectRequest(req.body)) {
    DEBUG_INFO("Adding party to roster with ID: '" << request->party_id << "'");
    registerParty(NodeAddress{request->party_id, request->host, request->port});

    res.status = 200;
    nlohmann::json response = {{"received", true},
                               {"coordinator_id", config_.node_id}};
    res.set_content(response.dump(), "application/json");
  } else {
    res.status = 400;
    res.set_content("{\"error\":\"Invalid request\"}", "application/json");
  }
}

void CoordinatorNode::handleEndpointMessage(const httplib::Request &req,
                                            httplib::Response &res) {
  auto parsed = parseMessage(req.body);
  if (!parsed) {
    writeReply(res, makeError(config_.node_id, "",
                              ErrorCode::ProtocolInvalidMessage,
                              "unparseable envelope"));
    return;
  }
  const Message &message = *parsed;

  const auto *round = message.as<CountRoundPayload>();
  if (message.destination_id != config_.node_id || round == nullptr) {
    DEBUG_WARN("Rejecting " << messageTypeToString(message.type()) << " from "
                            << message.source_id);
    writeReply(res, makeError(config_.node_id, message.source_id,
                              ErrorCode::ProtocolSequenceError,
                              "coordinator only accepts returning count rounds"));
    return;
  }

  if (round->session_id != session_id_) {
    writeReply(res, makeError(config_.node_id, message.source_id,
                              ErrorCode::ProtocolUnknownSession,
                              "session " + round->session_id,
                              round->tree_node_id));
    return;
  }

  // Only the last party closes a pass, after every party added its share
  std::string last_member = ring_.empty() ? "" : ring_.back().node_id;
  int closing_round = static_cast<int>(ring_.size()) + 1;
  if (message.source_id != last_member ||
      round->state.round != closing_round) {
    writeReply(res, makeError(config_.node_id, message.source_id,
                              ErrorCode::ProtocolSequenceError,
                              "sum " + round->state.sum_id + " returned by " +
                                  message.source_id + " in round " +
                                  std::to_string(round->state.round) +
                                  ", expected " + last_member + " in round " +
                                  std::to_string(closing_round),
                              round->tree_node_id));
    return;
  }

  {
    std::lock_guard<std::mutex> lock(open_sums_mutex_);
    auto it = open_sums_.find(round->state.sum_id);
    if (it == open_sums_.end() || it->second.has_value()) {
      writeReply(res, makeError(config_.node_id, message.source_id,
                                ErrorCode::ProtocolSequenceError,
                                "sum " + round->state.sum_id + " is not open",
                                round->tree_node_id));
      return;
    }
    it->second = round->state;
  }

  writeReply(res, makeAck(config_.node_id, message.source_id,
                          MessageType::CountRound));
}

Result<std::vector<std::string>> CoordinatorNode::ringOrder() const {
  std::vector<std::string> order;
  for (const auto &entry : config_.attribute_partitioning) {
    auto assignment = parsePartitioningEntry(entry);
    if (!assignment) {
      return Result<std::vector<std::string>>(
          ErrorCode::SystemInvalidConfiguration,
          "bad partitioning entry '" + entry + "'");
    }
    if (std::find(order.begin(), order.end(), assignment->party_id) ==
        order.end()) {
      order.push_back(assignment->party_id);
    }
  }
  if (order.empty()) {
    return Result<std::vector<std::string>>(
        ErrorCode::SystemInvalidConfiguration,
        "attribute_partitioning is empty");
  }
  return order;
}

Result<void> CoordinatorNode::awaitParties() {
  auto order = ringOrder();
  if (order.isError()) {
    lifecycle_.fail();
    return Result<void>(order.error(), order.message());
  }
  if (auto connecting = lifecycle_.transition(NodeState::Connecting);
      connecting.isError()) {
    return connecting;
  }

  auto all_registered = [&]() {
    if (roster_.size() < static_cast<size_t>(config_.expected_parties)) {
      return false;
    }
    for (const auto &party_id : order.value()) {
      auto it = std::find_if(roster_.begin(), roster_.end(),
                             [&](const NodeAddress &entry) {
                               return entry.node_id == party_id;
                             });
      if (it == roster_.end()) {
        return false;
      }
    }
    return true;
  };

  LOG("Waiting for " << order.value().size() << " parties to register...");
  std::vector<NodeAddress> roster;
  {
    std::unique_lock<std::mutex> lock(roster_mutex_);
    bool ready = roster_cv_.wait_for(
        lock, std::chrono::seconds(config_.registration_timeout_seconds),
        [&]() {
          return all_registered() ||
                 lifecycle_.state() == NodeState::Stopped;
        });
    if (!ready || lifecycle_.state() == NodeState::Stopped) {
      lock.unlock();
      lifecycle_.fail();
      return Result<void>(ErrorCode::NetworkTimeout,
                          "parties did not register within " +
                              std::to_string(
                                  config_.registration_timeout_seconds) +
                              "s");
    }
    roster = roster_;
  }

  ring_.clear();
  for (const auto &party_id : order.value()) {
    for (const auto &entry : roster) {
      if (entry.node_id == party_id) {
        ring_.push_back(entry);
      }
    }
  }

  for (const auto &party : ring_) {
    Endpoint endpoint{party.node_id, party.host, party.port};
    auto probe = probeNode(endpoint, config_.connect_retries,
                           config_.retry_delay_ms,
                           config_.socket_timeout_seconds);
    if (probe.isError()) {
      LOG_ERROR(vertree::describeError(probe.error(), probe.message()));
      lifecycle_.fail();
      return probe;
    }
    registry_.insert(endpoint);
  }

  LOG("Connected to all " << ring_.size() << " parties");
  return lifecycle_.transition(NodeState::ConnectedToAllParties);
}

Result<Message> CoordinatorNode::send(const std::string &party_id,
                                      MessagePayload payload) {
  return postMessage(registry_,
                     Message{config_.node_id, party_id, std::move(payload)});
}

Result<void> CoordinatorNode::initiate() {
  auto config = TreeConfig::fromMap(config_.configuration);
  if (config.isError()) {
    lifecycle_.fail();
    return Result<void>(config.error(), config.message());
  }
  auto class_index = resolveClassIndex(config.value().class_index,
                                       config_.attribute_partitioning);
  if (class_index.isError()) {
    lifecycle_.fail();
    return Result<void>(class_index.error(), class_index.message());
  }
  tree_config_ = config.value();
  tree_config_.class_index = class_index.value();

  InitiationPayload initiation;
  initiation.coordinator_id = config_.node_id;
  initiation.dataset_name = config_.dataset_name;
  initiation.attribute_partitioning = config_.attribute_partitioning;
  initiation.configuration = config_.configuration;
  initiation.configuration["classIndex"] = std::to_string(class_index.value());
  for (const auto &party : ring_) {
    initiation.participating_nodes.push_back(party.node_id);
    initiation.ring.push_back(party);
  }
  initiation.ring.push_back(
      NodeAddress{config_.node_id, config_.host, listen_port_});

  try {
    initiation.session_id = generateSessionId(config_.node_id);
    secure_sum_ = std::make_unique<SecureSum>(
        config_.node_id, static_cast<int>(ring_.size()) + 1,
        tree_config_.allow_insecure_ring);
  } catch (const std::runtime_error &e) {
    lifecycle_.fail();
    return Result<void>(ErrorCode::MPCComputationFailed, e.what());
  }
  session_id_ = initiation.session_id;
  if (!secure_sum_->providesPrivacy()) {
    LOG_ERROR("Ring of " << ring_.size() + 1
                         << " members: revealed totals equal the single "
                            "party's own counts");
  }

  LOG("Broadcasting Initiation for session " << session_id_);
  std::vector<std::pair<std::string, SchemaReport>> reports;
  for (const auto &party : ring_) {
    auto reply = send(party.node_id, initiation);
    if (reply.isError()) {
      lifecycle_.fail();
      return Result<void>(reply.error(), reply.message());
    }
    auto ack = expectAck(reply.value(), MessageType::Initiation);
    if (ack.isError() || !ack.value().schema) {
      lifecycle_.fail();
      return ack.isError()
                 ? Result<void>(ack.error(), ack.message())
                 : Result<void>(ErrorCode::ProtocolInvalidMessage,
                                party.node_id + " sent no schema report");
    }
    reports.emplace_back(party.node_id, *ack.value().schema);
  }

  auto merged = mergeSchemaReports(reports, class_index.value());
  if (merged.isError()) {
    LOG_ERROR(vertree::describeError(merged.error(), merged.message()));
    lifecycle_.fail();
    return Result<void>(merged.error(), merged.message());
  }
  schema_ = merged.moveValue();

  return lifecycle_.transition(NodeState::RoundActive);
}

Result<std::vector<uint64_t>>
CoordinatorNode::ringPass(CountRoundPayload round, size_t slots) {
  if (!secure_sum_ || ring_.empty()) {
    return Result<std::vector<uint64_t>>(ErrorCode::SystemInvalidState,
                                         "no session initiated");
  }

  auto opened = secure_sum_->initiateArray(std::vector<uint64_t>(slots, 0));
  if (opened.isError()) {
    return Result<std::vector<uint64_t>>(opened.error(), opened.message());
  }
  round.session_id = session_id_;
  round.state = opened.moveValue();
  const std::string sum_id = round.state.sum_id;

  {
    std::lock_guard<std::mutex> lock(open_sums_mutex_);
    open_sums_[sum_id] = std::nullopt;
  }

  // The chain is synchronous: when the first party replies, the last one
  // has already handed the state back through /message
  auto reply = send(ring_.front().node_id, round);
  std::optional<SecureSumState> returned;
  {
    std::lock_guard<std::mutex> lock(open_sums_mutex_);
    returned = open_sums_[sum_id];
    open_sums_.erase(sum_id);
  }

  Result<AckPayload> ack =
      reply.isError() ? Result<AckPayload>(reply.error(), reply.message())
                      : expectAck(reply.value(), MessageType::CountRound);
  if (ack.isError()) {
    secure_sum_->abandon(sum_id);
    return Result<std::vector<uint64_t>>(ack.error(), ack.message());
  }
  if (!returned) {
    secure_sum_->abandon(sum_id);
    return Result<std::vector<uint64_t>>(ErrorCode::ProtocolSequenceError,
                                         "sum " + sum_id +
                                             " was acknowledged but never "
                                             "returned");
  }

  auto sums = secure_sum_->finalizeArray(*returned);
  if (sums.isSuccess()) {
    sums_run_++;
  }
  return sums;
}

Result<NodeStatistics>
CoordinatorNode::nodeStatistics(const std::string &tree_node_id) {
  auto round = statisticsRound(schema_, tree_node_id);
  auto sums = ringPass(round, roundSlots(schema_, round));
  if (sums.isError()) {
    return Result<NodeStatistics>(sums.error(), sums.message());
  }
  return decodeNodeStatistics(sums.value(), round.num_class_values);
}

Result<CountMatrix>
CoordinatorNode::attributeCounts(const std::string &tree_node_id,
                                 int attribute_index) {
  auto round = attributeRound(schema_, tree_node_id, attribute_index);
  if (round.isError()) {
    return Result<CountMatrix>(round.error(), round.message());
  }
  auto sums = ringPass(round.value(), roundSlots(schema_, round.value()));
  if (sums.isError()) {
    return Result<CountMatrix>(sums.error(), sums.message());
  }
  return SecureInformationGain::unflatten(sums.value(),
                                          round.value().num_attribute_values,
                                          round.value().num_class_values);
}

Result<void>
CoordinatorNode::splitNode(const std::string &tree_node_id,
                           int attribute_index,
                           const std::vector<std::string> &child_node_ids) {
  SplitDecisionPayload split;
  split.session_id = session_id_;
  split.tree_node_id = tree_node_id;
  split.attribute_index = attribute_index;
  split.owner_id = schema_.owners.at(attribute_index);
  split.child_node_ids = child_node_ids;

  // The owner partitions first and hands back the row lists
  auto owner_reply = send(split.owner_id, split);
  if (owner_reply.isError()) {
    return Result<void>(owner_reply.error(), owner_reply.message());
  }
  auto owner_ack = expectAck(owner_reply.value(), MessageType::SplitDecision);
  if (owner_ack.isError()) {
    return Result<void>(owner_ack.error(), owner_ack.message());
  }
  if (!owner_ack.value().child_rows) {
    return Result<void>(ErrorCode::ProtocolInvalidMessage,
                        split.owner_id + " returned no child rows");
  }

  split.child_rows = owner_ack.value().child_rows;
  for (const auto &party : ring_) {
    if (party.node_id == split.owner_id) {
      continue;
    }
    auto reply = send(party.node_id, split);
    if (reply.isError()) {
      return Result<void>(reply.error(), reply.message());
    }
    auto ack = expectAck(reply.value(), MessageType::SplitDecision);
    if (ack.isError()) {
      return Result<void>(ack.error(), ack.message());
    }
  }
  return Result<void>();
}

void CoordinatorNode::broadcastTreeComplete(uint64_t node_count) {
  TreeCompletePayload complete{session_id_, node_count};
  for (const auto &party : ring_) {
    auto reply = send(party.node_id, complete);
    auto ack = reply.isError()
                   ? Result<AckPayload>(reply.error(), reply.message())
                   : expectAck(reply.value(), MessageType::TreeComplete);
    if (ack.isError()) {
      LOG_ERROR("TreeComplete to " << party.node_id << ": "
                                   << vertree::describeError(ack.error(),
                                                             ack.message()));
    }
  }
}

Result<std::unique_ptr<TreeNode>> CoordinatorNode::buildTree() {
  if (lifecycle_.state() != NodeState::RoundActive) {
    return Result<std::unique_ptr<TreeNode>>(
        ErrorCode::SystemInvalidState,
        std::string("cannot build while ") +
            nodeStateToString(lifecycle_.state()));
  }

  DistributedTreeBuilder builder(*this, tree_config_);
  auto tree = builder.build();
  report_ = builder.report();
  if (tree.isError()) {
    LOG_ERROR("Tree construction failed: "
              << vertree::describeError(tree.error(), tree.message()));
    lifecycle_.fail();
    return tree;
  }

  broadcastTreeComplete(report_.nodes_created);
  if (auto done = lifecycle_.transition(NodeState::TreeComplete);
      done.isError()) {
    return Result<std::unique_ptr<TreeNode>>(done.error(), done.message());
  }

  if (!config_.model_output.empty()) {
    auto saved = saveModel(config_.model_output, *tree.value(),
                           schema_.attributes, schema_.class_index);
    if (saved.isError()) {
      LOG_ERROR(vertree::describeError(saved.error(), saved.message()));
    } else {
      LOG("Model written to " << config_.model_output);
    }
  }
  return tree;
}

Result<std::unique_ptr<TreeNode>> CoordinatorNode::run() {
  if (auto parties = awaitParties(); parties.isError()) {
    return Result<std::unique_ptr<TreeNode>>(parties.error(), parties.message());
  }
  if (auto initiated = initiate(); initiated.isError()) {
    return Result<std::unique_ptr<TreeNode>>(initiated.error(),
                                             initiated.message());
  }
  return buildTree();
}
