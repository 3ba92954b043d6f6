#include "core/local_party_network.hpp"
#include "utils/ids.hpp"
#include "utils/logging.hpp"
#include <stdexcept>

using vertree::ErrorCode;
using vertree::Result;

LocalPartyNetwork::LocalPartyNetwork(
    std::string coordinator_id,
    std::vector<std::unique_ptr<LocalParty>> parties)
    : coordinator_id_(std::move(coordinator_id)),
      parties_(std::move(parties)) {}

Result<void> LocalPartyNetwork::initiate(
    const std::string &dataset_name,
    const std::vector<std::string> &attribute_partitioning,
    const std::map<std::string, std::string> &configuration) {
  auto config = TreeConfig::fromMap(configuration);
  if (config.isError()) {
    return Result<void>(config.error(), config.message());
  }
  auto class_index =
      resolveClassIndex(config.value().class_index, attribute_partitioning);
  if (class_index.isError()) {
    return Result<void>(class_index.error(), class_index.message());
  }

  InitiationPayload initiation;
  initiation.coordinator_id = coordinator_id_;
  initiation.dataset_name = dataset_name;
  initiation.attribute_partitioning = attribute_partitioning;
  initiation.configuration = configuration;
  initiation.configuration["classIndex"] = std::to_string(class_index.value());
  for (const auto &party : parties_) {
    initiation.participating_nodes.push_back(party->id());
  }

  try {
    initiation.session_id = generateSessionId(coordinator_id_);
    secure_sum_ = std::make_unique<SecureSum>(
        coordinator_id_, static_cast<int>(parties_.size()) + 1,
        config.value().allow_insecure_ring);
  } catch (const std::runtime_error &e) {
    return Result<void>(ErrorCode::MPCComputationFailed, e.what());
  }
  session_id_ = initiation.session_id;

  std::vector<std::pair<std::string, SchemaReport>> reports;
  for (const auto &party : parties_) {
    auto report = party->initiate(initiation);
    if (report.isError()) {
      return Result<void>(report.error(), report.message());
    }
    reports.emplace_back(party->id(), report.moveValue());
  }

  auto merged = mergeSchemaReports(reports, class_index.value());
  if (merged.isError()) {
    return Result<void>(merged.error(), merged.message());
  }
  schema_ = merged.moveValue();
  sums_run_ = 0;
  return Result<void>();
}

void LocalPartyNetwork::complete(uint64_t node_count) {
  for (const auto &party : parties_) {
    party->releaseScopes();
  }
  DEBUG_INFO("Session " << session_id_ << " complete with " << node_count
                        << " tree nodes");
}

Result<std::vector<uint64_t>>
LocalPartyNetwork::ringPass(CountRoundPayload round, size_t slots) {
  if (!secure_sum_) {
    return Result<std::vector<uint64_t>>(ErrorCode::SystemInvalidState,
                                         "no session initiated");
  }

  auto opened = secure_sum_->initiateArray(std::vector<uint64_t>(slots, 0));
  if (opened.isError()) {
    return Result<std::vector<uint64_t>>(opened.error(), opened.message());
  }

  round.session_id = session_id_;
  round.state = opened.moveValue();
  for (const auto &party : parties_) {
    auto next = party->participate(round);
    if (next.isError()) {
      secure_sum_->abandon(round.state.sum_id);
      return Result<std::vector<uint64_t>>(next.error(), next.message());
    }
    round.state = next.moveValue();
  }

  auto sums = secure_sum_->finalizeArray(round.state);
  if (sums.isSuccess()) {
    ++sums_run_;
  }
  return sums;
}

Result<NodeStatistics>
LocalPartyNetwork::nodeStatistics(const std::string &tree_node_id) {
  auto round = statisticsRound(schema_, tree_node_id);
  auto sums = ringPass(round, roundSlots(schema_, round));
  if (sums.isError()) {
    return Result<NodeStatistics>(sums.error(), sums.message());
  }
  return decodeNodeStatistics(sums.value(), round.num_class_values);
}

Result<CountMatrix>
LocalPartyNetwork::attributeCounts(const std::string &tree_node_id,
                                   int attribute_index) {
  auto round = attributeRound(schema_, tree_node_id, attribute_index);
  if (round.isError()) {
    return Result<CountMatrix>(round.error(), round.message());
  }
  auto sums = ringPass(round.value(), roundSlots(schema_, round.value()));
  if (sums.isError()) {
    return Result<CountMatrix>(sums.error(), sums.message());
  }
  return SecureInformationGain::unflatten(sums.value(),
                                          round.value().num_attribute_values,
                                          round.value().num_class_values);
}

Result<void>
LocalPartyNetwork::splitNode(const std::string &tree_node_id,
                             int attribute_index,
                             const std::vector<std::string> &child_node_ids) {
  SplitDecisionPayload split;
  split.session_id = session_id_;
  split.tree_node_id = tree_node_id;
  split.attribute_index = attribute_index;
  split.owner_id = schema_.owners.at(attribute_index);
  split.child_node_ids = child_node_ids;

  LocalParty *owner = nullptr;
  for (const auto &party : parties_) {
    if (party->id() == split.owner_id) {
      owner = party.get();
    }
  }
  if (owner == nullptr) {
    return Result<void>(ErrorCode::ProtocolPartyNotRegistered,
                        "owner " + split.owner_id + " is not in the ring");
  }

  auto rows = owner->applySplit(split);
  if (rows.isError()) {
    return Result<void>(rows.error(), rows.message());
  }

  split.child_rows = rows.moveValue();
  for (const auto &party : parties_) {
    if (party.get() == owner) {
      continue;
    }
    auto applied = party->applySplit(split);
    if (applied.isError()) {
      return Result<void>(applied.error(), applied.message());
    }
  }
  return Result<void>();
}
