#pragma once
#include "protocol/messages.hpp"
#include "utils/connection_registry.hpp"
#include "utils/error_codes.hpp"
#include <httplib.h>
#include <string>

// POSTs one envelope to a registered peer's /message endpoint and returns
// the peer's reply envelope. Transport failures map to Network* codes.
vertree::Result<Message> postMessage(ConnectionRegistry &registry,
                                     const Message &message);

// Ack reply of the expected kind, or the error the reply carries
vertree::Result<AckPayload> expectAck(const Message &reply,
                                      MessageType acknowledged);

// 200 for Ack; 4xx/5xx for Error depending on the code's category
int httpStatusFor(const Message &reply);

void writeReply(httplib::Response &res, const Message &reply);

// GET /status until it answers 200, up to `attempts` tries spaced
// `retry_delay_ms` apart
vertree::Result<void> probeNode(const Endpoint &endpoint, int attempts,
                                int retry_delay_ms, int timeout_seconds);
