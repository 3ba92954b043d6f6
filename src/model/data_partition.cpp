#include "model/data_partition.hpp"
#include "utils/error_codes.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <stdexcept>

DataPartition::DataPartition(std::vector<int> global_indices,
                             std::vector<AttributeMetadata> attributes,
                             std::vector<std::vector<int>> rows)
    : global_indices_(std::move(global_indices)),
      attributes_(std::move(attributes)), rows_(std::move(rows)) {
  if (global_indices_.size() != attributes_.size()) {
    throw vertree::DataFormatError(
        "Partition has " + std::to_string(global_indices_.size()) +
        " global indices for " + std::to_string(attributes_.size()) +
        " attributes");
  }
  for (size_t i = 0; i < rows_.size(); ++i) {
    if (rows_[i].size() != attributes_.size()) {
      throw vertree::DataFormatError(
          "Row " + std::to_string(i) + " has " +
          std::to_string(rows_[i].size()) + " values, expected " +
          std::to_string(attributes_.size()));
    }
  }
}

std::optional<size_t> DataPartition::localColumn(int global_index) const {
  for (size_t i = 0; i < global_indices_.size(); ++i) {
    if (global_indices_[i] == global_index) {
      return i;
    }
  }
  return std::nullopt;
}

std::vector<int>
DataPartition::column(size_t local_column,
                      const std::vector<uint32_t> &row_indices) const {
  std::vector<int> values;
  values.reserve(row_indices.size());
  for (uint32_t r : row_indices) {
    values.push_back(rows_.at(r).at(local_column));
  }
  return values;
}

std::string DataPartition::partitioningEntry(const std::string &party_id) const {
  std::ostringstream out;
  for (size_t i = 0; i < global_indices_.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << global_indices_[i];
  }
  out << ":" << party_id;
  return out.str();
}

std::vector<std::vector<int>> distributeAttributes(const Dataset &dataset,
                                                   int num_parties,
                                                   bool include_class) {
  if (num_parties < 1) {
    throw std::invalid_argument("num_parties must be >= 1");
  }

  int num_attributes = static_cast<int>(dataset.attributes.size());
  int class_index =
      dataset.class_index >= 0 ? dataset.class_index : num_attributes - 1;

  std::vector<int> non_class;
  for (int i = 0; i < num_attributes; ++i) {
    if (i != class_index) {
      non_class.push_back(i);
    }
  }

  int per_party = static_cast<int>(non_class.size()) / num_parties;
  int remainder = static_cast<int>(non_class.size()) % num_parties;

  std::vector<std::vector<int>> distribution(num_parties);
  size_t next = 0;
  for (int p = 0; p < num_parties; ++p) {
    int count = per_party + (p < remainder ? 1 : 0);
    for (int k = 0; k < count && next < non_class.size(); ++k) {
      distribution[p].push_back(non_class[next++]);
    }
    if (include_class) {
      distribution[p].push_back(class_index);
    }
  }

  DEBUG_DEBUG("Distributed " << non_class.size() << " attributes over "
                             << num_parties << " parties");
  return distribution;
}

Dataset selectColumns(const Dataset &dataset,
                      const std::vector<int> &global_indices) {
  Dataset selected;
  selected.relation = dataset.relation;
  for (size_t i = 0; i < global_indices.size(); ++i) {
    selected.attributes.push_back(dataset.attributes.at(global_indices[i]));
    if (global_indices[i] == dataset.class_index) {
      selected.class_index = static_cast<int>(i);
    }
  }

  selected.rows.reserve(dataset.rows.size());
  for (const auto &full_row : dataset.rows) {
    std::vector<int> row;
    row.reserve(global_indices.size());
    for (int index : global_indices) {
      row.push_back(full_row.at(index));
    }
    selected.rows.push_back(std::move(row));
  }
  return selected;
}

DataPartition createVerticalPartition(const Dataset &dataset,
                                      const std::vector<int> &global_indices) {
  Dataset selected = selectColumns(dataset, global_indices);
  return DataPartition(global_indices, std::move(selected.attributes),
                       std::move(selected.rows));
}

std::optional<PartitionAssignment>
parsePartitioningEntry(const std::string &entry) {
  auto colon = entry.rfind(':');
  if (colon == std::string::npos || colon + 1 >= entry.size()) {
    return std::nullopt;
  }

  PartitionAssignment assignment;
  assignment.party_id = entry.substr(colon + 1);

  std::stringstream indices(entry.substr(0, colon));
  std::string token;
  try {
    while (std::getline(indices, token, ',')) {
      if (token.empty()) {
        return std::nullopt;
      }
      size_t consumed = 0;
      int index = std::stoi(token, &consumed);
      if (consumed != token.size() || index < 0) {
        return std::nullopt;
      }
      assignment.global_indices.push_back(index);
    }
  } catch (const std::exception &e) {
    DEBUG_ERROR("Bad partitioning entry '" << entry << "': " << e.what());
    return std::nullopt;
  }

  if (assignment.global_indices.empty()) {
    return std::nullopt;
  }
  return assignment;
}
