#include "node/local_cluster.hpp"
#include "node/coordinator_node.hpp"
#include "node/data_party_node.hpp"
#include "utils/logging.hpp"
#include <vector>

using vertree::ErrorCode;
using vertree::Result;

Result<LocalClusterResult> trainOverLocalhost(const Dataset &dataset,
                                              const LocalClusterOptions &options) {
  if (options.num_parties < 1) {
    return Result<LocalClusterResult>(ErrorCode::SystemInvalidConfiguration,
                                      "at least one data party is required");
  }

  auto assignments =
      distributeAttributes(dataset, options.num_parties, options.replicate_class);

  CoordinatorConfig config("");
  config.host = "localhost";
  config.port = options.base_port;
  config.dataset_name = dataset.relation.empty() ? "dataset" : dataset.relation;
  config.expected_parties = options.num_parties;
  config.configuration = options.configuration;
  config.configuration["classIndex"] = std::to_string(dataset.class_index);
  config.model_output = options.model_output;
  config.registration_timeout_seconds = 10;

  std::vector<std::unique_ptr<DataPartyNode>> parties;
  for (int i = 0; i < options.num_parties; ++i) {
    std::string party_id = "party" + std::to_string(i + 1);
    DataPartition partition = createVerticalPartition(dataset, assignments[i]);
    config.attribute_partitioning.push_back(
        partition.partitioningEntry(party_id));

    int port = options.base_port == 0 ? 0 : options.base_port + i + 1;
    PartyConfig party_config("");
    party_config.retry_delay_ms = 200;
    parties.push_back(std::make_unique<DataPartyNode>(
        party_id, port, selectColumns(dataset, assignments[i]), party_config));
  }
  config.validate();

  CoordinatorNode coordinator(config);
  auto stopAll = [&]() {
    for (auto &party : parties) {
      party->stop();
    }
    coordinator.stop();
  };

  if (auto started = coordinator.start(); started.isError()) {
    return Result<LocalClusterResult>(started.error(), started.message());
  }
  for (auto &party : parties) {
    auto started = party->start();
    if (started.isSuccess()) {
      started = party->connectToCoordinator("localhost",
                                            coordinator.getListenPort());
    }
    if (started.isError()) {
      stopAll();
      return Result<LocalClusterResult>(started.error(), started.message());
    }
  }

  auto tree = coordinator.run();
  stopAll();
  if (tree.isError()) {
    return Result<LocalClusterResult>(tree.error(), tree.message());
  }

  LocalClusterResult result;
  result.tree = std::move(tree.value());
  result.report = coordinator.report();
  DEBUG_INFO("Local cluster finished: " << result.report.nodes_created
                                        << " nodes, "
                                        << result.report.secure_sums
                                        << " secure sums");
  return Result<LocalClusterResult>(std::move(result));
}
