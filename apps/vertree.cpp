#include "io/arff_loader.hpp"
#include "io/model_file.hpp"
#include "io/tree_traversal.hpp"
#include "io/values_parser.hpp"
#include "node/coordinator_node.hpp"
#include "node/data_party_node.hpp"
#include "node/local_cluster.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

void printUsage() {
  std::cout << "Usage:\n"
            << "  vertree coordinator <port> [configFile]\n"
            << "  vertree dataparty <nodeId> <port> <coordinatorHost> "
               "<coordinatorPort> [datasetFile]\n"
            << "  vertree partition <datasetFile> <numParties> <outPrefix>\n"
            << "  vertree test <datasetFile> [basePort]\n"
            << "  vertree predict <datasetFile> <recordFile> [basePort]\n";
}

int parsePort(const std::string &text) {
  try {
    size_t consumed = 0;
    int port = std::stoi(text, &consumed);
    if (consumed == text.size() && port >= 0 && port <= 65535) {
      return port;
    }
  } catch (const std::logic_error &) {
  }
  LOG_AND_EXIT("Invalid port: " << text, 2);
}

Dataset loadDatasetOrExit(const std::string &path) {
  try {
    return loadArff(path);
  } catch (const vertree::DataFormatError &e) {
    LOG_AND_EXIT(e.what(), 1);
  }
}

LocalClusterResult trainOrExit(const Dataset &dataset, int base_port) {
  LocalClusterOptions options;
  options.base_port = base_port;
  auto trained = trainOverLocalhost(dataset, options);
  if (trained.isError()) {
    LOG_AND_EXIT("Training failed: "
                     << vertree::describeError(trained.error(), trained.message()),
                 1);
  }
  return std::move(trained.value());
}

int runCoordinator(int argc, char *argv[]) {
  if (argc < 3) {
    printUsage();
    return 2;
  }
  int port = parsePort(argv[2]);
  std::string config_file = argc >= 4 ? argv[3] : "coordinator.json";

  CoordinatorConfig config(config_file);
  config.port = port;
  config.validate();

  CoordinatorNode coordinator(config);
  if (auto started = coordinator.start(); started.isError()) {
    LOG_AND_EXIT(vertree::describeError(started.error(), started.message()), 1);
  }

  auto tree = coordinator.run();
  if (tree.isError()) {
    coordinator.stop();
    LOG_AND_EXIT("Session failed: "
                     << vertree::describeError(tree.error(), tree.message()),
                 1);
  }

  const BuildReport &report = coordinator.report();
  std::cout << formatTree(*tree.value());
  LOG(coordinator.getNodeId() << ": tree complete, " << report.nodes_created
                              << " nodes, " << report.leaves << " leaves, "
                              << report.secure_sums << " secure sums");
  coordinator.stop();
  return 0;
}

int runDataParty(int argc, char *argv[]) {
  if (argc < 6) {
    printUsage();
    return 2;
  }
  std::string node_id = argv[2];
  int port = parsePort(argv[3]);
  std::string coordinator_host = argv[4];
  int coordinator_port = parsePort(argv[5]);
  std::string dataset_file = argc >= 7 ? argv[6] : node_id + ".arff";

  Dataset columns = loadDatasetOrExit(dataset_file);
  DataPartyNode party(node_id, port, std::move(columns), PartyConfig());

  if (auto started = party.start(); started.isError()) {
    LOG_AND_EXIT(vertree::describeError(started.error(), started.message()), 1);
  }
  if (auto connected =
          party.connectToCoordinator(coordinator_host, coordinator_port);
      connected.isError()) {
    party.stop();
    LOG_AND_EXIT(vertree::describeError(connected.error(), connected.message()),
                 1);
  }

  LOG("Party " << party.getNodeId() << " is running. Press Ctrl+C to exit");
  while (party.state() != NodeState::Stopped) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  return 0;
}

// Writes <outPrefix><partyId>.arff per party and prints the matching
// attribute_partitioning entries for coordinator.json
int runPartition(int argc, char *argv[]) {
  if (argc < 5) {
    printUsage();
    return 2;
  }
  Dataset dataset = loadDatasetOrExit(argv[2]);
  int num_parties = 0;
  try {
    num_parties = std::stoi(argv[3]);
  } catch (const std::logic_error &) {
    LOG_AND_EXIT("Invalid party count: " << argv[3], 2);
  }
  if (num_parties < 1) {
    LOG_AND_EXIT("Invalid party count: " << argv[3], 2);
  }
  std::string prefix = argv[4];

  auto assignments = distributeAttributes(dataset, num_parties, true);
  for (int i = 0; i < num_parties; ++i) {
    std::string party_id = "party" + std::to_string(i + 1);
    std::string path = prefix + party_id + ".arff";
    try {
      saveArff(path, selectColumns(dataset, assignments[i]));
    } catch (const vertree::DataFormatError &e) {
      LOG_AND_EXIT(e.what(), 1);
    }
    std::cout << createVerticalPartition(dataset, assignments[i])
                     .partitioningEntry(party_id)
              << "  -> " << path << "\n";
  }
  return 0;
}

int runTest(int argc, char *argv[]) {
  if (argc < 3) {
    printUsage();
    return 2;
  }
  Dataset dataset = loadDatasetOrExit(argv[2]);
  int base_port = argc >= 4 ? parsePort(argv[3]) : 0;

  LocalClusterResult result = trainOrExit(dataset, base_port);
  std::cout << formatTree(*result.tree);
  std::cout << "Nodes: " << result.report.nodes_created
            << ", leaves: " << result.report.leaves
            << ", secure sums: " << result.report.secure_sums << "\n";
  std::cout << "Training accuracy: "
            << trainingAccuracy(*result.tree, dataset) * 100.0 << "%\n";
  return 0;
}

int runPredict(int argc, char *argv[]) {
  if (argc < 4) {
    printUsage();
    return 2;
  }
  Dataset dataset = loadDatasetOrExit(argv[2]);
  int base_port = argc >= 5 ? parsePort(argv[4]) : 0;

  FeatureValues record;
  try {
    record = loadValuesFile(argv[3], dataset.attributes);
  } catch (const vertree::DataFormatError &e) {
    LOG_AND_EXIT(e.what(), 1);
  }

  LocalClusterResult result = trainOrExit(dataset, base_port);
  const LeafNode *leaf = classify(*result.tree, record);
  if (leaf == nullptr) {
    LOG_AND_EXIT("Record reached a branch with no leaf", 1);
  }
  std::cout << "Prediction: " << leaf->class_label << "\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage();
    return 2;
  }

  std::string command = argv[1];
  try {
    if (command == "coordinator") return runCoordinator(argc, argv);
    if (command == "dataparty") return runDataParty(argc, argv);
    if (command == "partition") return runPartition(argc, argv);
    if (command == "test") return runTest(argc, argv);
    if (command == "predict") return runPredict(argc, argv);
  } catch (const std::exception &e) {
    LOG_AND_EXIT(e.what(), 1);
  }

  printUsage();
  return 2;
}
