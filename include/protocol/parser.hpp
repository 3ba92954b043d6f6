#pragma once
#include "protocol/messages.hpp"
#include <optional>
#include <string>

std::optional<Message> parseMessage(const std::string &body);
std::optional<ConnectRequest> parseConnectRequest(const std::string &body);
std::string serializeMessage(const Message &message);
