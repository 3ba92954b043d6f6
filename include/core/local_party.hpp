#pragma once
#include "core/tree_config.hpp"
#include "model/data_partition.hpp"
#include "mpc/secure_sum.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Party-side protocol logic, independent of the transport. Holds the
// party's columns and, per tree node, the scope of rows that reached it.
// The network node and the in-process network drive the same object.
class LocalParty {
public:
  LocalParty(std::string party_id, Dataset local_columns);

  const std::string &id() const { return party_id_; }
  size_t rowCount() const { return local_columns_.rows.size(); }

  // Binds local columns to their global indices from this party's
  // partitioning entry and resets the scopes to the root node.
  vertree::Result<SchemaReport> initiate(const InitiationPayload &initiation);

  // Adds this party's contribution to the ring state. The named contributor
  // adds its local counts, every other party adds zeros.
  vertree::Result<SecureSumState> participate(const CountRoundPayload &round);

  // Contribution vector for one count round. Node statistics rounds
  // (attribute == class) produce numClass class counts plus the row count;
  // attribute rounds produce the flattened attribute x class matrix.
  vertree::Result<std::vector<uint64_t>>
  contribution(const CountRoundPayload &round) const;

  // Without child_rows the party must own the attribute: it partitions its
  // scope and returns the lists. With child_rows it adopts them.
  vertree::Result<std::vector<std::vector<uint32_t>>>
  applySplit(const SplitDecisionPayload &split);

  void releaseScopes();

  std::optional<std::vector<uint32_t>> scope(const std::string &tree_node_id) const;
  size_t scopeCount() const;
  int ringPosition() const { return ring_position_; }
  const std::string &sessionId() const { return session_id_; }
  const DataPartition &partition() const { return partition_; }

private:
  vertree::Result<void> checkSession(const std::string &session_id) const;
  vertree::Result<std::vector<std::vector<uint32_t>>>
  partitionScope(const std::vector<uint32_t> &rows, int attribute_index,
                 size_t num_children) const;

  std::string party_id_;
  Dataset local_columns_;
  DataPartition partition_;

  std::string session_id_;
  int class_index_ = -1;
  int ring_position_ = -1;
  std::unique_ptr<SecureSum> secure_sum_;

  std::unordered_map<std::string, std::vector<uint32_t>> scopes_;
  mutable std::mutex mutex_;
};
