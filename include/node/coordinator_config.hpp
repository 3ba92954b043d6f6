#pragma once
#include "protocol/messages.hpp"
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

struct CoordinatorConfig {
  // Identity and network settings
  std::string node_id;
  std::string host;
  int port;

  // Run description
  std::string dataset_name;
  int expected_parties;
  std::vector<std::string> attribute_partitioning;
  std::vector<NodeAddress> parties; // registered without a /connect call
  std::map<std::string, std::string> configuration;

  // Connection settings
  int connect_retries;
  int retry_delay_ms;
  int socket_timeout_seconds;
  int registration_timeout_seconds;

  // Where the finished tree is written; empty for no file
  std::string model_output;

  CoordinatorConfig(const std::string &configFile = "coordinator.json") {
    // Set defaults
    node_id = "coordinator";
    host = "localhost";
    port = 8080;
    dataset_name = "dataset";
    expected_parties = 2;
    connect_retries = 3;
    retry_delay_ms = 1000;
    socket_timeout_seconds = 30;
    registration_timeout_seconds = 120;
    model_output = "";

    // Try to load from config file
    std::ifstream file(configFile);
    if (file.is_open()) {
      try {
        nlohmann::json config;
        file >> config;

        if (config.contains("node_id")) node_id = config["node_id"];
        if (config.contains("host")) host = config["host"];
        if (config.contains("port")) port = config["port"];
        if (config.contains("dataset_name")) dataset_name = config["dataset_name"];
        if (config.contains("expected_parties")) expected_parties = config["expected_parties"];
        if (config.contains("attribute_partitioning")) attribute_partitioning = config["attribute_partitioning"].get<std::vector<std::string>>();
        if (config.contains("parties")) parties = config["parties"].get<std::vector<NodeAddress>>();
        if (config.contains("configuration")) configuration = config["configuration"].get<std::map<std::string, std::string>>();
        if (config.contains("connect_retries")) connect_retries = config["connect_retries"];
        if (config.contains("retry_delay_ms")) retry_delay_ms = config["retry_delay_ms"];
        if (config.contains("socket_timeout_seconds")) socket_timeout_seconds = config["socket_timeout_seconds"];
        if (config.contains("registration_timeout_seconds")) registration_timeout_seconds = config["registration_timeout_seconds"];
        if (config.contains("model_output")) model_output = config["model_output"];

        validate();
      } catch (const std::exception &e) {
        throw std::runtime_error("Failed to load config from " + configFile + ": " + e.what());
      }
    } else {
      validate();
    }
  }

  void validate() const {
    if (node_id.empty()) {
      throw std::invalid_argument("node_id cannot be empty");
    }

    if (host.empty()) {
      throw std::invalid_argument("Host cannot be empty");
    }

    if (port < 0 || port > 65535) {
      throw std::invalid_argument("Invalid port: " + std::to_string(port) + ". Must be 0-65535 (0 = auto-assign)");
    }

    if (expected_parties < 1) {
      throw std::invalid_argument("Invalid expected_parties: " + std::to_string(expected_parties) + ". Must be >= 1");
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

    if (registration_timeout_seconds < 1) {
      throw std::invalid_argument("Invalid registration_timeout_seconds: " + std::to_string(registration_timeout_seconds) + ". Must be >= 1");
    }

    for (const auto &party : parties) {
      if (party.node_id.empty() || party.host.empty() || party.port < 1 || party.port > 65535) {
        throw std::invalid_argument("Invalid static party entry '" + party.node_id + "'");
      }
    }
  }
};
