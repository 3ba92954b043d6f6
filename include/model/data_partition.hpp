#pragma once
#include "model/attribute_metadata.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Value stored for a missing cell
inline constexpr int kMissingValue = -1;

// The columns of the dataset one party holds. Row i here and row i on every
// other party describe the same record; only that positional correspondence
// links the partitions together.
class DataPartition {
public:
  DataPartition() = default;
  DataPartition(std::vector<int> global_indices,
                std::vector<AttributeMetadata> attributes,
                std::vector<std::vector<int>> rows);

  size_t rowCount() const { return rows_.size(); }
  size_t columnCount() const { return attributes_.size(); }

  const std::vector<int> &globalIndices() const { return global_indices_; }
  const std::vector<AttributeMetadata> &attributes() const {
    return attributes_;
  }
  const std::vector<int> &row(size_t index) const { return rows_.at(index); }

  std::optional<size_t> localColumn(int global_index) const;

  // Values of one held column for the given rows, in row order
  std::vector<int> column(size_t local_column,
                          const std::vector<uint32_t> &row_indices) const;

  // "0,1,2:party1" for this partition
  std::string partitioningEntry(const std::string &party_id) const;

private:
  std::vector<int> global_indices_;
  std::vector<AttributeMetadata> attributes_;
  std::vector<std::vector<int>> rows_;
};

// Full (unpartitioned) table as produced by the dataset loader
struct Dataset {
  std::string relation;
  std::vector<AttributeMetadata> attributes;
  std::vector<std::vector<int>> rows;
  int class_index = -1;
};

// Column split of a dataset across parties: non-class attributes are dealt
// out as evenly as possible (the first `remainder` parties take one extra)
// and the class column is optionally given to every party.
std::vector<std::vector<int>> distributeAttributes(const Dataset &dataset,
                                                   int num_parties,
                                                   bool include_class);

// The given columns of the dataset, in the given order. This is the table a
// party keeps on disk; the class index is kept only if the column survives.
Dataset selectColumns(const Dataset &dataset,
                      const std::vector<int> &global_indices);

DataPartition createVerticalPartition(const Dataset &dataset,
                                      const std::vector<int> &global_indices);

// Parses "<csv-indices>:<partyId>"
struct PartitionAssignment {
  std::vector<int> global_indices;
  std::string party_id;
};
std::optional<PartitionAssignment>
parsePartitioningEntry(const std::string &entry);
