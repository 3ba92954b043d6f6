#pragma once
#include "model/attribute_metadata.hpp"
#include "mpc/secure_sum.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class MessageType {
  Initiation = 0,
  CountRound,
  SplitDecision,
  Ack,
  Error,
  TreeComplete
};

const char *messageTypeToString(MessageType type);

NLOHMANN_JSON_SERIALIZE_ENUM(MessageType,
                             {{MessageType::Initiation, "Initiation"},
                              {MessageType::CountRound, "CountRound"},
                              {MessageType::SplitDecision, "SplitDecision"},
                              {MessageType::Ack, "Ack"},
                              {MessageType::Error, "Error"},
                              {MessageType::TreeComplete, "TreeComplete"}})

struct NodeAddress {
  std::string node_id;
  std::string host;
  int port = 0;
};

struct InitiationPayload {
  std::string session_id;
  std::string coordinator_id;
  std::vector<std::string> participating_nodes; // ring order
  std::string dataset_name;
  std::vector<std::string> attribute_partitioning; // "<csv-indices>:<partyId>"
  std::map<std::string, std::string> configuration;
  std::vector<NodeAddress> ring; // parties in ring order, then the coordinator
};

// Asks the ring for one secure sum at one tree node. attribute_index equal to
// the class index requests the node statistics (class tally + row count).
struct CountRoundPayload {
  std::string session_id;
  std::string tree_node_id;
  int attribute_index = -1;
  std::string contributor_id;
  int num_attribute_values = 0;
  int num_class_values = 0;
  SecureSumState state;
};

// Sent to the attribute owner without child_rows; the owner's Ack returns
// them and the coordinator forwards them to every other party.
struct SplitDecisionPayload {
  std::string session_id;
  std::string tree_node_id;
  int attribute_index = -1;
  std::string owner_id;
  std::vector<std::string> child_node_ids;
  std::optional<std::vector<std::vector<uint32_t>>> child_rows;
};

struct HeldAttribute {
  int global_index = -1;
  AttributeMetadata metadata;
};

struct SchemaReport {
  std::vector<HeldAttribute> attributes;
  uint64_t row_count = 0;
};

struct AckPayload {
  MessageType acknowledged = MessageType::Ack;
  std::optional<SchemaReport> schema;                         // Initiation
  std::optional<std::vector<std::vector<uint32_t>>> child_rows; // SplitDecision (owner)
};

struct ErrorPayload {
  vertree::ErrorCode code = vertree::ErrorCode::Success;
  std::string message;
  std::string tree_node_id;
};

struct TreeCompletePayload {
  std::string session_id;
  uint64_t node_count = 0;
};

using MessagePayload =
    std::variant<InitiationPayload, CountRoundPayload, SplitDecisionPayload,
                 AckPayload, ErrorPayload, TreeCompletePayload>;

struct Message {
  std::string source_id;
  std::string destination_id;
  MessagePayload payload;

  MessageType type() const;

  template <typename T> const T *as() const { return std::get_if<T>(&payload); }
};

// Party registration sent to the coordinator's /connect endpoint
struct ConnectRequest {
  std::string party_id;
  std::string host;
  int port = 0;
};

Message makeAck(const std::string &source, const std::string &destination,
                MessageType acknowledged);
Message makeError(const std::string &source, const std::string &destination,
                  vertree::ErrorCode code, const std::string &message,
                  const std::string &tree_node_id = "");

// JSON conversion functions
void to_json(nlohmann::json &j, const NodeAddress &a);
void from_json(const nlohmann::json &j, NodeAddress &a);
void to_json(nlohmann::json &j, const InitiationPayload &p);
void from_json(const nlohmann::json &j, InitiationPayload &p);
void to_json(nlohmann::json &j, const CountRoundPayload &p);
void from_json(const nlohmann::json &j, CountRoundPayload &p);
void to_json(nlohmann::json &j, const SplitDecisionPayload &p);
void from_json(const nlohmann::json &j, SplitDecisionPayload &p);
void to_json(nlohmann::json &j, const HeldAttribute &h);
void from_json(const nlohmann::json &j, HeldAttribute &h);
void to_json(nlohmann::json &j, const SchemaReport &s);
void from_json(const nlohmann::json &j, SchemaReport &s);
void to_json(nlohmann::json &j, const AckPayload &p);
void from_json(const nlohmann::json &j, AckPayload &p);
void to_json(nlohmann::json &j, const ErrorPayload &p);
void from_json(const nlohmann::json &j, ErrorPayload &p);
void to_json(nlohmann::json &j, const TreeCompletePayload &p);
void from_json(const nlohmann::json &j, TreeCompletePayload &p);
void to_json(nlohmann::json &j, const ConnectRequest &c);
void from_json(const nlohmann::json &j, ConnectRequest &c);
void to_json(nlohmann::json &j, const Message &m);
void from_json(const nlohmann::json &j, Message &m);
