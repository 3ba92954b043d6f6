#include "node/data_party_node.hpp"
#include "node/node_transport.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <type_traits>
#include <variant>

using vertree::ErrorCode;
using vertree::Result;

DataPartyNode::DataPartyNode(const std::string &node_id, int listen_port,
                             Dataset local_columns, const PartyConfig &config)
    : node_id_(node_id), listen_port_(listen_port), config_(config),
      party_(node_id, std::move(local_columns)) {
  registry_.setTimeouts(config_.socket_timeout_seconds,
                        config_.socket_timeout_seconds);
  svr_.set_read_timeout(config_.socket_timeout_seconds, 0);
  svr_.set_write_timeout(config_.socket_timeout_seconds, 0);
  setupRoutes();

  LOG("Created DataPartyNode with ID: " << node_id_);
}

DataPartyNode::~DataPartyNode() { stop(); }

Result<void> DataPartyNode::start() {
  if (listen_port_ == 0) {
    listen_port_ = svr_.bind_to_any_port(config_.listen_host);
  } else if (!svr_.bind_to_port(config_.listen_host, listen_port_)) {
    listen_port_ = -1;
  }
  if (listen_port_ < 0) {
    lifecycle_.fail();
    return Result<void>(ErrorCode::NetworkBindFailed,
                        config_.listen_host + " for party " + node_id_);
  }

  if (auto listening = lifecycle_.transition(NodeState::Listening);
      listening.isError()) {
    svr_.stop();
    return listening;
  }

  listener_thread_ = std::thread([this]() {
    DEBUG_INFO("Party listener thread started");
    svr_.listen_after_bind();
  });
  LOG("Party " << node_id_ << " listening on " << config_.listen_host << ":"
               << listen_port_);
  return Result<void>();
}

void DataPartyNode::stop() {
  if (lifecycle_.state() != NodeState::Stopped &&
      lifecycle_.transition(NodeState::Stopped).isSuccess()) {
    LOG("Stopping party " << node_id_);
  }
  svr_.stop();
  if (listener_thread_.joinable()) {
    listener_thread_.join();
  }
  registry_.closeAll();
}

Result<void> DataPartyNode::connectToCoordinator(const std::string &host,
                                                 int port) {
  if (auto connecting = lifecycle_.transition(NodeState::Connecting);
      connecting.isError()) {
    return connecting;
  }

  ConnectRequest request;
  request.party_id = node_id_;
  request.host = config_.listen_host;
  request.port = listen_port_;
  nlohmann::json j = request;
  std::string json_body = j.dump();

  for (int attempt = 1; attempt <= config_.connect_retries; ++attempt) {
    httplib::Client cli(host, port);
    cli.set_connection_timeout(config_.socket_timeout_seconds, 0);
    cli.set_read_timeout(config_.socket_timeout_seconds, 0);

    LOG("Connecting to coordinator at " << host << ":" << port << " (attempt "
                                        << attempt << ")");
    auto res = cli.Post("/connect", json_body, "application/json");
    if (res && res->status == 200) {
      LOG("Registered with coordinator");
      DEBUG_DEBUG("Response: " << res->body);
      if (!lifecycle_.transitionFrom(NodeState::Connecting,
                                     NodeState::Listening)) {
        DEBUG_DEBUG("Initiation arrived before the registration reply");
      }
      return Result<void>();
    }

    DEBUG_ERROR("Failed to connect to coordinator. Status: "
                << (res ? std::to_string(res->status) : "No response"));
    if (attempt < config_.connect_retries) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(config_.retry_delay_ms));
    }
  }

  lifecycle_.fail();
  return Result<void>(ErrorCode::NetworkConnectionFailed,
                      "coordinator at " + host + ":" + std::to_string(port) +
                          " after " + std::to_string(config_.connect_retries) +
                          " attempts");
}

void DataPartyNode::setupRoutes() {
  svr_.Get("/status",
           [this](const httplib::Request &req, httplib::Response &res) {
             this->handleEndpointStatus(req, res);
           });

  svr_.Post("/message",
            [this](const httplib::Request &req, httplib::Response &res) {
              DEBUG_DEBUG("MESSAGE: Received data: " << req.body);
              this->handleEndpointMessage(req, res);
            });
}

void DataPartyNode::handleEndpointStatus(const httplib::Request &,
                                         httplib::Response &res) {
  nlohmann::json status = {{"node_id", node_id_},
                           {"state", nodeStateToString(lifecycle_.state())}};
  res.status = 200;
  res.set_content(status.dump(), "application/json");
}

Message DataPartyNode::replyError(const Message &message, ErrorCode code,
                                  const std::string &detail,
                                  const std::string &tree_node_id) {
  LOG_ERROR(vertree::describeError(code, detail));
  return makeError(node_id_, message.source_id, code, detail, tree_node_id);
}

void DataPartyNode::handleEndpointMessage(const httplib::Request &req,
                                          httplib::Response &res) {
  auto parsed = parseMessage(req.body);
  if (!parsed) {
    Message unknown;
    writeReply(res, replyError(unknown, ErrorCode::ProtocolInvalidMessage,
                               "unparseable envelope"));
    return;
  }
  const Message &message = *parsed;

  if (message.destination_id != node_id_) {
    writeReply(res, replyError(message, ErrorCode::ProtocolSequenceError,
                               "message for " + message.destination_id +
                                   " delivered to " + node_id_));
    return;
  }

  Message reply = std::visit(
      [&](const auto &payload) -> Message {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, InitiationPayload>) {
          return handleInitiation(message, payload);
        } else if constexpr (std::is_same_v<T, CountRoundPayload>) {
          return handleCountRound(message, payload);
        } else if constexpr (std::is_same_v<T, SplitDecisionPayload>) {
          return handleSplitDecision(message, payload);
        } else if constexpr (std::is_same_v<T, TreeCompletePayload>) {
          return handleTreeComplete(message, payload);
        } else {
          return replyError(message, ErrorCode::ProtocolSequenceError,
                            std::string("unexpected ") +
                                messageTypeToString(message.type()));
        }
      },
      message.payload);

  writeReply(res, reply);
}

Message DataPartyNode::handleInitiation(const Message &message,
                                        const InitiationPayload &initiation) {
  NodeState current = lifecycle_.state();
  if (current != NodeState::RoundActive &&
      lifecycle_.transition(NodeState::RoundActive).isError()) {
    return replyError(message, ErrorCode::SystemInvalidState,
                      std::string("Initiation while ") +
                          nodeStateToString(current));
  }

  auto report = party_.initiate(initiation);
  if (report.isError()) {
    return replyError(message, report.error(), std::string(report.message()));
  }

  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    ring_ = initiation.ring;
    coordinator_id_ = initiation.coordinator_id;
  }
  for (const auto &member : initiation.ring) {
    if (member.node_id != node_id_) {
      registry_.insert(Endpoint{member.node_id, member.host, member.port});
    }
  }

  LOG("Session " << initiation.session_id << " started for dataset "
                 << initiation.dataset_name);
  Message ack = makeAck(node_id_, message.source_id, MessageType::Initiation);
  std::get<AckPayload>(ack.payload).schema = report.moveValue();
  return ack;
}

Message DataPartyNode::handleCountRound(const Message &message,
                                        const CountRoundPayload &round) {
  auto next_state = party_.participate(round);
  if (next_state.isError()) {
    return replyError(message, next_state.error(),
                      std::string(next_state.message()), round.tree_node_id);
  }

  std::string successor;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    size_t position = static_cast<size_t>(party_.ringPosition());
    if (position + 1 >= ring_.size()) {
      return replyError(message, ErrorCode::ProtocolStateError,
                        "no successor in the ring", round.tree_node_id);
    }
    successor = ring_[position + 1].node_id;
  }

  CountRoundPayload forwarded = round;
  forwarded.state = next_state.moveValue();
  DEBUG_DEBUG("Forwarding sum " << forwarded.state.sum_id << " round "
                                << forwarded.state.round << " to "
                                << successor);

  auto reply = postMessage(registry_, Message{node_id_, successor, forwarded});
  if (reply.isError()) {
    return replyError(message, reply.error(), std::string(reply.message()),
                      round.tree_node_id);
  }

  // Unwind the downstream outcome to our predecessor
  auto ack = expectAck(reply.value(), MessageType::CountRound);
  if (ack.isError()) {
    return makeError(node_id_, message.source_id, ack.error(),
                     std::string(ack.message()), round.tree_node_id);
  }
  return makeAck(node_id_, message.source_id, MessageType::CountRound);
}

Message DataPartyNode::handleSplitDecision(const Message &message,
                                           const SplitDecisionPayload &split) {
  bool owner_request = !split.child_rows.has_value();
  auto rows = party_.applySplit(split);
  if (rows.isError()) {
    return replyError(message, rows.error(), std::string(rows.message()),
                      split.tree_node_id);
  }

  Message ack = makeAck(node_id_, message.source_id, MessageType::SplitDecision);
  if (owner_request) {
    std::get<AckPayload>(ack.payload).child_rows = rows.moveValue();
  }
  return ack;
}

Message DataPartyNode::handleTreeComplete(const Message &message,
                                          const TreeCompletePayload &complete) {
  if (party_.sessionId().empty() || complete.session_id != party_.sessionId()) {
    return replyError(message, ErrorCode::ProtocolUnknownSession,
                      "TreeComplete for " + complete.session_id);
  }
  if (auto done = lifecycle_.transition(NodeState::TreeComplete);
      done.isError()) {
    return replyError(message, done.error(), std::string(done.message()));
  }

  party_.releaseScopes();
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    for (const auto &member : ring_) {
      registry_.remove(member.node_id);
    }
  }
  LOG("Session " << complete.session_id << " complete: tree of "
                 << complete.node_count << " nodes");
  return makeAck(node_id_, message.source_id, MessageType::TreeComplete);
}
