#include "node/node_transport.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <thread>

using vertree::ErrorCategory;
using vertree::ErrorCode;
using vertree::Result;

Result<Message> postMessage(ConnectionRegistry &registry,
                            const Message &message) {
  std::string body = serializeMessage(message);
  Result<Message> outcome(ErrorCode::NetworkInvalidResponse, "no reply");

  bool registered = registry.withConnection(
      message.destination_id, [&](httplib::Client *client) {
        auto res = client->Post("/message", body, "application/json");
        if (!res) {
          ErrorCode code = res.error() == httplib::Error::Read
                               ? ErrorCode::NetworkTimeout
                               : ErrorCode::NetworkPeerUnreachable;
          outcome = Result<Message>(code, message.destination_id + ": " +
                                              httplib::to_string(res.error()));
          return;
        }

        auto reply = parseMessage(res->body);
        if (!reply) {
          outcome = Result<Message>(ErrorCode::NetworkInvalidResponse,
                                    "HTTP " + std::to_string(res->status) +
                                        " from " + message.destination_id);
          return;
        }
        outcome = Result<Message>(std::move(*reply));
      });

  if (!registered) {
    return Result<Message>(ErrorCode::ProtocolPartyNotRegistered,
                           "no connection to " + message.destination_id);
  }
  if (outcome.isError()) {
    if (auto endpoint = registry.lookup(message.destination_id)) {
      DEBUG_WARN("POST to " << endpoint->host << ":" << endpoint->port
                            << " failed: " << outcome.message());
    }
  }
  return outcome;
}

Result<AckPayload> expectAck(const Message &reply, MessageType acknowledged) {
  if (const auto *error = reply.as<ErrorPayload>()) {
    return Result<AckPayload>(error->code, reply.source_id + ": " + error->message);
  }
  const auto *ack = reply.as<AckPayload>();
  if (ack == nullptr || ack->acknowledged != acknowledged) {
    return Result<AckPayload>(ErrorCode::ProtocolSequenceError,
                              std::string("expected Ack of ") +
                                  messageTypeToString(acknowledged) + " from " +
                                  reply.source_id);
  }
  return *ack;
}

int httpStatusFor(const Message &reply) {
  const auto *error = reply.as<ErrorPayload>();
  if (error == nullptr) {
    return 200;
  }
  switch (vertree::getErrorCategory(error->code)) {
  case ErrorCategory::Network:
    return 502;
  case ErrorCategory::Protocol:
    return error->code == ErrorCode::ProtocolSequenceError ? 409 : 400;
  case ErrorCategory::Data:
    return 422;
  default:
    return 500;
  }
}

void writeReply(httplib::Response &res, const Message &reply) {
  res.status = httpStatusFor(reply);
  res.set_content(serializeMessage(reply), "application/json");
}

Result<void> probeNode(const Endpoint &endpoint, int attempts,
                       int retry_delay_ms, int timeout_seconds) {
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    httplib::Client cli(endpoint.host, endpoint.port);
    cli.set_connection_timeout(timeout_seconds, 0);
    cli.set_read_timeout(timeout_seconds, 0);

    auto res = cli.Get("/status");
    if (res && res->status == 200) {
      DEBUG_DEBUG("Probe of " << endpoint.node_id << " answered: " << res->body);
      return Result<void>();
    }

    DEBUG_WARN("Probe " << attempt << "/" << attempts << " of "
                        << endpoint.node_id << " at " << endpoint.host << ":"
                        << endpoint.port << " failed");
    if (attempt < attempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(retry_delay_ms));
    }
  }

  return Result<void>(ErrorCode::NetworkPeerUnreachable,
                      endpoint.node_id + " at " + endpoint.host + ":" +
                          std::to_string(endpoint.port) + " after " +
                          std::to_string(attempts) + " attempts");
}
