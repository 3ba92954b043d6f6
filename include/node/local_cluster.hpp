#pragma once
#include "core/tree_builder.hpp"
#include "model/data_partition.hpp"
#include "model/tree_node.hpp"
#include "utils/error_codes.hpp"
#include <map>
#include <memory>
#include <string>

struct LocalClusterOptions {
  int num_parties = 2;
  int base_port = 0; // 0 for ephemeral ports; else coordinator, then parties
  bool replicate_class = true;
  std::map<std::string, std::string> configuration;
  std::string model_output;
};

struct LocalClusterResult {
  std::unique_ptr<TreeNode> tree;
  BuildReport report;
};

// Trains over localhost: splits the dataset by column, starts a coordinator
// and one data party per column group, registers the parties over /connect
// and runs the whole session. Every node is stopped before returning.
vertree::Result<LocalClusterResult>
trainOverLocalhost(const Dataset &dataset,
                   const LocalClusterOptions &options = LocalClusterOptions());
