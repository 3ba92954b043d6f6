#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace {

bool isKnownType(const nlohmann::json &type) {
  if (!type.is_string()) {
    return false;
  }
  const auto &name = type.get_ref<const std::string &>();
  for (auto candidate : {MessageType::Initiation, MessageType::CountRound,
                         MessageType::SplitDecision, MessageType::Ack,
                         MessageType::Error, MessageType::TreeComplete}) {
    if (name == messageTypeToString(candidate)) {
      return true;
    }
  }
  return false;
}

} // namespace

std::optional<Message> parseMessage(const std::string &body) {
  try {
    DEBUG_DEBUG("Parsing Message");
    nlohmann::json j = nlohmann::json::parse(body);

    // Validate required fields
    if (!j.contains("source_id") || !j.contains("destination_id") ||
        !j.contains("type") || !j.contains("payload")) {
      DEBUG_DEBUG("Missing required fields in message envelope");
      return std::nullopt;
    }

    if (!isKnownType(j["type"])) {
      DEBUG_DEBUG("Unknown message type: " << j["type"].dump());
      return std::nullopt;
    }

    return j.get<Message>();

  } catch (const nlohmann::json::exception &e) {
    DEBUG_ERROR("JSON parsing error: " << e.what());
    return std::nullopt;
  } catch (const std::invalid_argument &e) {
    DEBUG_ERROR("Invalid message content: " << e.what());
    return std::nullopt;
  }
}

std::optional<ConnectRequest> parseConnectRequest(const std::string &body) {
  try {
    DEBUG_DEBUG("Parsing ConnectRequest");
    nlohmann::json j = nlohmann::json::parse(body);

    // Validate required fields
    if (!j.contains("party_id") || !j.contains("host") || !j.contains("port")) {
      DEBUG_DEBUG("Missing required fields in connect request");
      return std::nullopt;
    }

    auto request = j.get<ConnectRequest>();
    if (request.party_id.empty() || request.port < 1 || request.port > 65535) {
      DEBUG_DEBUG("Connect request with empty id or bad port");
      return std::nullopt;
    }
    return request;

  } catch (const nlohmann::json::exception &e) {
    DEBUG_ERROR("JSON parsing error: " << e.what());
    return std::nullopt;
  }
}

std::string serializeMessage(const Message &message) {
  nlohmann::json j = message;
  return j.dump();
}
