#pragma once
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

struct PartyConfig {
  // Address announced to the coordinator and bound by the listener
  std::string listen_host;

  // Connection settings
  int connect_retries;
  int retry_delay_ms;
  int socket_timeout_seconds;

  PartyConfig(const std::string &configFile = "party.json") {
    // Set defaults
    listen_host = "localhost";
    connect_retries = 3;
    retry_delay_ms = 1000;
    socket_timeout_seconds = 30;

    // Try to load from config file
    std::ifstream file(configFile);
    if (file.is_open()) {
      try {
        nlohmann::json config;
        file >> config;

        if (config.contains("listen_host")) listen_host = config["listen_host"];
        if (config.contains("connect_retries")) connect_retries = config["connect_retries"];
        if (config.contains("retry_delay_ms")) retry_delay_ms = config["retry_delay_ms"];
        if (config.contains("socket_timeout_seconds")) socket_timeout_seconds = config["socket_timeout_seconds"];

        validate();
      } catch (const std::exception &e) {
        throw std::runtime_error("Failed to load config from " + configFile + ": " + e.what());
      }
    } else {
      validate();
    }
  }

  void validate() const {
    if (listen_host.empty()) {
      throw std::invalid_argument("Listen host cannot be empty");
    }

    if (connect_retries < 1) {
      throw std::invalid_argument("Invalid connect_retries: " + std::to_string(connect_retries) + ". Must be >= 1");
    }

    if (retry_delay_ms < 0) {
      throw std::invalid_argument("Invalid retry_delay_ms: " + std::to_string(retry_delay_ms) + ". Must be >= 0");
    }

    if (socket_timeout_seconds < 1) {
      throw std::invalid_argument("Invalid socket_timeout_seconds: " + std::to_string(socket_timeout_seconds) + ". Must be >= 1");
    }
  }
};
