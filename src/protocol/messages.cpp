#include "protocol/messages.hpp"
#include <stdexcept>
#include <type_traits>

const char *messageTypeToString(MessageType type) {
  switch (type) {
  case MessageType::Initiation: return "Initiation";
  case MessageType::CountRound: return "CountRound";
  case MessageType::SplitDecision: return "SplitDecision";
  case MessageType::Ack: return "Ack";
  case MessageType::Error: return "Error";
  case MessageType::TreeComplete: return "TreeComplete";
  }
  return "Unknown";
}

MessageType Message::type() const {
  return std::visit(
      [](const auto &p) -> MessageType {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, InitiationPayload>) {
          return MessageType::Initiation;
        } else if constexpr (std::is_same_v<T, CountRoundPayload>) {
          return MessageType::CountRound;
        } else if constexpr (std::is_same_v<T, SplitDecisionPayload>) {
          return MessageType::SplitDecision;
        } else if constexpr (std::is_same_v<T, AckPayload>) {
          return MessageType::Ack;
        } else if constexpr (std::is_same_v<T, ErrorPayload>) {
          return MessageType::Error;
        } else {
          return MessageType::TreeComplete;
        }
      },
      payload);
}

Message makeAck(const std::string &source, const std::string &destination,
                MessageType acknowledged) {
  AckPayload ack;
  ack.acknowledged = acknowledged;
  return Message{source, destination, std::move(ack)};
}

Message makeError(const std::string &source, const std::string &destination,
                  vertree::ErrorCode code, const std::string &message,
                  const std::string &tree_node_id) {
  ErrorPayload error;
  error.code = code;
  error.message = message;
  error.tree_node_id = tree_node_id;
  return Message{source, destination, std::move(error)};
}

// JSON conversion functions for NodeAddress
void to_json(nlohmann::json &j, const NodeAddress &a) {
  j = nlohmann::json{{"node_id", a.node_id}, {"host", a.host}, {"port", a.port}};
}

void from_json(const nlohmann::json &j, NodeAddress &a) {
  j.at("node_id").get_to(a.node_id);
  j.at("host").get_to(a.host);
  j.at("port").get_to(a.port);
}

// JSON conversion functions for InitiationPayload
void to_json(nlohmann::json &j, const InitiationPayload &p) {
  j = nlohmann::json{{"session_id", p.session_id},
                     {"coordinator_id", p.coordinator_id},
                     {"participating_nodes", p.participating_nodes},
                     {"dataset_name", p.dataset_name},
                     {"attribute_partitioning", p.attribute_partitioning},
                     {"configuration", p.configuration},
                     {"ring", p.ring}};
}

void from_json(const nlohmann::json &j, InitiationPayload &p) {
  j.at("session_id").get_to(p.session_id);
  j.at("coordinator_id").get_to(p.coordinator_id);
  j.at("participating_nodes").get_to(p.participating_nodes);
  j.at("dataset_name").get_to(p.dataset_name);
  j.at("attribute_partitioning").get_to(p.attribute_partitioning);
  j.at("configuration").get_to(p.configuration);
  j.at("ring").get_to(p.ring);
}

// JSON conversion functions for CountRoundPayload
void to_json(nlohmann::json &j, const CountRoundPayload &p) {
  j = nlohmann::json{{"session_id", p.session_id},
                     {"tree_node_id", p.tree_node_id},
                     {"attribute_index", p.attribute_index},
                     {"contributor_id", p.contributor_id},
                     {"num_attribute_values", p.num_attribute_values},
                     {"num_class_values", p.num_class_values},
                     {"state", p.state}};
}

void from_json(const nlohmann::json &j, CountRoundPayload &p) {
  j.at("session_id").get_to(p.session_id);
  j.at("tree_node_id").get_to(p.tree_node_id);
  j.at("attribute_index").get_to(p.attribute_index);
  j.at("contributor_id").get_to(p.contributor_id);
  j.at("num_attribute_values").get_to(p.num_attribute_values);
  j.at("num_class_values").get_to(p.num_class_values);
  j.at("state").get_to(p.state);
}

// JSON conversion functions for SplitDecisionPayload
void to_json(nlohmann::json &j, const SplitDecisionPayload &p) {
  j = nlohmann::json{{"session_id", p.session_id},
                     {"tree_node_id", p.tree_node_id},
                     {"attribute_index", p.attribute_index},
                     {"owner_id", p.owner_id},
                     {"child_node_ids", p.child_node_ids}};
  if (p.child_rows) {
    j["child_rows"] = *p.child_rows;
  }
}

void from_json(const nlohmann::json &j, SplitDecisionPayload &p) {
  j.at("session_id").get_to(p.session_id);
  j.at("tree_node_id").get_to(p.tree_node_id);
  j.at("attribute_index").get_to(p.attribute_index);
  j.at("owner_id").get_to(p.owner_id);
  j.at("child_node_ids").get_to(p.child_node_ids);
  p.child_rows.reset();
  if (j.contains("child_rows")) {
    p.child_rows = j.at("child_rows").get<std::vector<std::vector<uint32_t>>>();
  }
}

// JSON conversion functions for the schema report
void to_json(nlohmann::json &j, const HeldAttribute &h) {
  j = nlohmann::json{{"global_index", h.global_index}, {"metadata", h.metadata}};
}

void from_json(const nlohmann::json &j, HeldAttribute &h) {
  j.at("global_index").get_to(h.global_index);
  j.at("metadata").get_to(h.metadata);
}

void to_json(nlohmann::json &j, const SchemaReport &s) {
  j = nlohmann::json{{"attributes", s.attributes}, {"row_count", s.row_count}};
}

void from_json(const nlohmann::json &j, SchemaReport &s) {
  j.at("attributes").get_to(s.attributes);
  j.at("row_count").get_to(s.row_count);
}

// JSON conversion functions for AckPayload
void to_json(nlohmann::json &j, const AckPayload &p) {
  j = nlohmann::json{{"acknowledged", p.acknowledged}};
  if (p.schema) {
    j["schema"] = *p.schema;
  }
  if (p.child_rows) {
    j["child_rows"] = *p.child_rows;
  }
}

void from_json(const nlohmann::json &j, AckPayload &p) {
  j.at("acknowledged").get_to(p.acknowledged);
  p.schema.reset();
  p.child_rows.reset();
  if (j.contains("schema")) {
    p.schema = j.at("schema").get<SchemaReport>();
  }
  if (j.contains("child_rows")) {
    p.child_rows = j.at("child_rows").get<std::vector<std::vector<uint32_t>>>();
  }
}

// JSON conversion functions for ErrorPayload
void to_json(nlohmann::json &j, const ErrorPayload &p) {
  j = nlohmann::json{{"code", static_cast<uint32_t>(p.code)},
                     {"message", p.message},
                     {"tree_node_id", p.tree_node_id}};
}

void from_json(const nlohmann::json &j, ErrorPayload &p) {
  p.code = static_cast<vertree::ErrorCode>(j.at("code").get<uint32_t>());
  j.at("message").get_to(p.message);
  p.tree_node_id = j.value("tree_node_id", std::string());
}

// JSON conversion functions for TreeCompletePayload
void to_json(nlohmann::json &j, const TreeCompletePayload &p) {
  j = nlohmann::json{{"session_id", p.session_id}, {"node_count", p.node_count}};
}

void from_json(const nlohmann::json &j, TreeCompletePayload &p) {
  j.at("session_id").get_to(p.session_id);
  j.at("node_count").get_to(p.node_count);
}

// JSON conversion functions for ConnectRequest
void to_json(nlohmann::json &j, const ConnectRequest &c) {
  j = nlohmann::json{
      {"party_id", c.party_id}, {"host", c.host}, {"port", c.port}};
}

void from_json(const nlohmann::json &j, ConnectRequest &c) {
  j.at("party_id").get_to(c.party_id);
  j.at("host").get_to(c.host);
  j.at("port").get_to(c.port);
}

// JSON conversion functions for the envelope
void to_json(nlohmann::json &j, const Message &m) {
  j = nlohmann::json{{"source_id", m.source_id},
                     {"destination_id", m.destination_id},
                     {"type", m.type()}};
  std::visit([&j](const auto &p) { j["payload"] = p; }, m.payload);
}

void from_json(const nlohmann::json &j, Message &m) {
  j.at("source_id").get_to(m.source_id);
  j.at("destination_id").get_to(m.destination_id);

  const auto &payload = j.at("payload");
  switch (j.at("type").get<MessageType>()) {
  case MessageType::Initiation:
    m.payload = payload.get<InitiationPayload>();
    break;
  case MessageType::CountRound:
    m.payload = payload.get<CountRoundPayload>();
    break;
  case MessageType::SplitDecision:
    m.payload = payload.get<SplitDecisionPayload>();
    break;
  case MessageType::Ack:
    m.payload = payload.get<AckPayload>();
    break;
  case MessageType::Error:
    m.payload = payload.get<ErrorPayload>();
    break;
  case MessageType::TreeComplete:
    m.payload = payload.get<TreeCompletePayload>();
    break;
  }
}
