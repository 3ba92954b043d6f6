#include "core/local_party.hpp"
#include "core/global_schema.hpp"
#include "model/tree_node.hpp"
#include "mpc/secure_information_gain.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <numeric>

using vertree::ErrorCode;
using vertree::Result;

LocalParty::LocalParty(std::string party_id, Dataset local_columns)
    : party_id_(std::move(party_id)),
      local_columns_(std::move(local_columns)) {
  DEBUG_INFO("Party " << party_id_ << " holds "
                      << local_columns_.attributes.size() << " columns, "
                      << local_columns_.rows.size() << " rows");
}

Result<SchemaReport> LocalParty::initiate(const InitiationPayload &initiation) {
  auto config = TreeConfig::fromMap(initiation.configuration);
  if (config.isError()) {
    return Result<SchemaReport>(config.error(), config.message());
  }
  auto class_index =
      resolveClassIndex(config.value().class_index,
                        initiation.attribute_partitioning);
  if (class_index.isError()) {
    return Result<SchemaReport>(class_index.error(), class_index.message());
  }

  std::optional<PartitionAssignment> mine;
  for (const auto &entry : initiation.attribute_partitioning) {
    auto assignment = parsePartitioningEntry(entry);
    if (assignment && assignment->party_id == party_id_) {
      mine = std::move(assignment);
      break;
    }
  }
  if (!mine) {
    return Result<SchemaReport>(ErrorCode::ProtocolPartyNotRegistered,
                                "no partitioning entry for " + party_id_);
  }
  if (mine->global_indices.size() != local_columns_.attributes.size()) {
    return Result<SchemaReport>(
        ErrorCode::DataSchemaMismatch,
        party_id_ + " was assigned " +
            std::to_string(mine->global_indices.size()) + " columns but holds " +
            std::to_string(local_columns_.attributes.size()));
  }

  const auto &ring = initiation.participating_nodes;
  auto position = std::find(ring.begin(), ring.end(), party_id_);
  if (position == ring.end()) {
    return Result<SchemaReport>(ErrorCode::ProtocolPartyNotRegistered,
                                party_id_ + " is not in the ring");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    partition_ = DataPartition(mine->global_indices, local_columns_.attributes,
                               local_columns_.rows);
    // The coordinator closes the ring
    secure_sum_ = std::make_unique<SecureSum>(
        party_id_, static_cast<int>(ring.size()) + 1,
        config.value().allow_insecure_ring);
  } catch (const vertree::DataFormatError &e) {
    return Result<SchemaReport>(e.code(), e.what());
  } catch (const std::runtime_error &e) {
    return Result<SchemaReport>(ErrorCode::MPCComputationFailed, e.what());
  }

  session_id_ = initiation.session_id;
  class_index_ = class_index.value();
  ring_position_ = static_cast<int>(position - ring.begin());

  std::vector<uint32_t> all_rows(partition_.rowCount());
  std::iota(all_rows.begin(), all_rows.end(), 0u);
  scopes_.clear();
  scopes_[kRootNodeId] = std::move(all_rows);

  SchemaReport report;
  report.row_count = partition_.rowCount();
  for (size_t i = 0; i < partition_.columnCount(); ++i) {
    report.attributes.push_back(
        HeldAttribute{partition_.globalIndices()[i], partition_.attributes()[i]});
  }

  LOG("Party " << party_id_ << " joined session " << session_id_
               << " at ring position " << ring_position_);
  return report;
}

Result<void> LocalParty::checkSession(const std::string &session_id) const {
  if (session_id_.empty() || session_id != session_id_) {
    return Result<void>(ErrorCode::ProtocolUnknownSession,
                        "session '" + session_id + "' is not active at " +
                            party_id_);
  }
  return Result<void>();
}

Result<SecureSumState> LocalParty::participate(const CountRoundPayload &round) {
  auto values = contribution(round);
  if (values.isError()) {
    return Result<SecureSumState>(values.error(), values.message());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (round.state.round != ring_position_ + 1) {
    return Result<SecureSumState>(
        ErrorCode::ProtocolSequenceError,
        party_id_ + " is ring position " + std::to_string(ring_position_) +
            " but the sum is in round " + std::to_string(round.state.round));
  }
  return secure_sum_->participateArray(round.state, values.value());
}

Result<std::vector<uint64_t>>
LocalParty::contribution(const CountRoundPayload &round) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto session = checkSession(round.session_id); session.isError()) {
    return Result<std::vector<uint64_t>>(session.error(), session.message());
  }

  auto scope_it = scopes_.find(round.tree_node_id);
  if (scope_it == scopes_.end()) {
    return Result<std::vector<uint64_t>>(
        ErrorCode::ProtocolSequenceError,
        "no rows scoped to tree node " + round.tree_node_id + " at " +
            party_id_);
  }
  const auto &rows = scope_it->second;

  int num_values = round.num_attribute_values;
  int num_classes = round.num_class_values;
  if (num_values <= 0 || num_classes <= 0) {
    return Result<std::vector<uint64_t>>(ErrorCode::DataSchemaMismatch,
                                         "declared cardinality must be positive");
  }

  bool statistics = round.attribute_index == class_index_;
  size_t slots = statistics ? static_cast<size_t>(num_classes) + 1
                            : static_cast<size_t>(num_values) * num_classes;
  if (round.contributor_id != party_id_) {
    return std::vector<uint64_t>(slots, 0);
  }

  auto class_column = partition_.localColumn(class_index_);
  if (!class_column) {
    return Result<std::vector<uint64_t>>(
        ErrorCode::DataSchemaMismatch,
        party_id_ + " cannot tally attribute " +
            std::to_string(round.attribute_index) +
            " without the class column");
  }
  if (partition_.attributes()[*class_column].numValues() != num_classes) {
    return Result<std::vector<uint64_t>>(ErrorCode::DataSchemaMismatch,
                                         "class cardinality mismatch");
  }
  auto class_values = partition_.column(*class_column, rows);

  if (statistics) {
    std::vector<uint64_t> tally(slots, 0);
    for (int c : class_values) {
      if (c >= 0 && c < num_classes) {
        tally[c]++;
      }
    }
    tally.back() = rows.size();
    return tally;
  }

  auto column = partition_.localColumn(round.attribute_index);
  if (!column) {
    return Result<std::vector<uint64_t>>(
        ErrorCode::DataSchemaMismatch,
        party_id_ + " does not hold attribute " +
            std::to_string(round.attribute_index));
  }
  const auto &metadata = partition_.attributes()[*column];
  if (!metadata.isNominal() || metadata.numValues() != num_values) {
    return Result<std::vector<uint64_t>>(
        ErrorCode::DataSchemaMismatch,
        "attribute " + metadata.name + " has " +
            std::to_string(metadata.numValues()) + " values, round expects " +
            std::to_string(num_values));
  }

  auto counts = SecureInformationGain::localCounts(
      partition_.column(*column, rows), class_values, num_values, num_classes);
  if (counts.isError()) {
    return Result<std::vector<uint64_t>>(counts.error(), counts.message());
  }
  return SecureInformationGain::flatten(counts.value());
}

Result<std::vector<std::vector<uint32_t>>>
LocalParty::partitionScope(const std::vector<uint32_t> &rows,
                           int attribute_index, size_t num_children) const {
  auto column = partition_.localColumn(attribute_index);
  if (!column) {
    return Result<std::vector<std::vector<uint32_t>>>(
        ErrorCode::DataSchemaMismatch,
        party_id_ + " does not own split attribute " +
            std::to_string(attribute_index));
  }

  // Missing or unindexed values go to no child
  std::vector<std::vector<uint32_t>> children(num_children);
  for (uint32_t r : rows) {
    int value = partition_.row(r)[*column];
    if (value >= 0 && static_cast<size_t>(value) < num_children) {
      children[value].push_back(r);
    }
  }
  return children;
}

Result<std::vector<std::vector<uint32_t>>>
LocalParty::applySplit(const SplitDecisionPayload &split) {
  using RowLists = std::vector<std::vector<uint32_t>>;

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto session = checkSession(split.session_id); session.isError()) {
    return Result<RowLists>(session.error(), session.message());
  }

  auto scope_it = scopes_.find(split.tree_node_id);
  if (scope_it == scopes_.end()) {
    return Result<RowLists>(ErrorCode::ProtocolSequenceError,
                            "no rows scoped to tree node " +
                                split.tree_node_id + " at " + party_id_);
  }
  if (split.child_node_ids.empty()) {
    return Result<RowLists>(ErrorCode::ProtocolInvalidMessage,
                            "split without children");
  }

  RowLists children;
  if (!split.child_rows) {
    auto partitioned = partitionScope(scope_it->second, split.attribute_index,
                                      split.child_node_ids.size());
    if (partitioned.isError()) {
      return partitioned;
    }
    children = partitioned.moveValue();
  } else {
    children = *split.child_rows;
    if (children.size() != split.child_node_ids.size()) {
      return Result<RowLists>(ErrorCode::ProtocolInvalidMessage,
                              "row lists do not match child ids");
    }
    for (const auto &list : children) {
      for (uint32_t r : list) {
        if (r >= partition_.rowCount()) {
          return Result<RowLists>(ErrorCode::ProtocolInvalidMessage,
                                  "row " + std::to_string(r) +
                                      " outside the partition");
        }
      }
    }
  }

  scopes_.erase(scope_it);
  for (size_t i = 0; i < children.size(); ++i) {
    scopes_[split.child_node_ids[i]] = children[i];
  }

  DEBUG_DEBUG("Party " << party_id_ << " split " << split.tree_node_id
                       << " on attribute " << split.attribute_index << " into "
                       << children.size() << " children");
  return children;
}

void LocalParty::releaseScopes() {
  std::lock_guard<std::mutex> lock(mutex_);
  scopes_.clear();
  DEBUG_DEBUG("Party " << party_id_ << " released its row scopes");
}

std::optional<std::vector<uint32_t>>
LocalParty::scope(const std::string &tree_node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = scopes_.find(tree_node_id);
  if (it == scopes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t LocalParty::scopeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scopes_.size();
}
