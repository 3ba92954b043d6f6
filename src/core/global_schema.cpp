#include "core/global_schema.hpp"
#include "model/data_partition.hpp"
#include "utils/logging.hpp"
#include <algorithm>

using vertree::ErrorCode;
using vertree::Result;

bool GlobalSchema::holds(const std::string &party_id, int global_index) const {
  if (global_index < 0 || static_cast<size_t>(global_index) >= holders.size()) {
    return false;
  }
  const auto &list = holders[global_index];
  return std::find(list.begin(), list.end(), party_id) != list.end();
}

const std::string &GlobalSchema::contributorFor(int global_index) const {
  for (const auto &party_id : holders.at(global_index)) {
    if (holds(party_id, class_index)) {
      return party_id;
    }
  }
  return owners.at(global_index);
}

Result<int>
attributeCountFromPartitioning(const std::vector<std::string> &partitioning) {
  int max_index = -1;
  for (const auto &entry : partitioning) {
    auto assignment = parsePartitioningEntry(entry);
    if (!assignment) {
      return Result<int>(ErrorCode::SystemInvalidConfiguration,
                         "bad partitioning entry '" + entry + "'");
    }
    for (int index : assignment->global_indices) {
      max_index = std::max(max_index, index);
    }
  }
  if (max_index < 0) {
    return Result<int>(ErrorCode::SystemInvalidConfiguration,
                       "attribute partitioning is empty");
  }
  return max_index + 1;
}

Result<int> resolveClassIndex(int class_index,
                              const std::vector<std::string> &partitioning) {
  auto count = attributeCountFromPartitioning(partitioning);
  if (count.isError()) {
    return count;
  }
  if (class_index < 0) {
    return count.value() - 1;
  }
  if (class_index >= count.value()) {
    return Result<int>(ErrorCode::SystemInvalidConfiguration,
                       "classIndex " + std::to_string(class_index) +
                           " outside " + std::to_string(count.value()) +
                           " attributes");
  }
  return class_index;
}

Result<GlobalSchema> mergeSchemaReports(
    const std::vector<std::pair<std::string, SchemaReport>> &reports,
    int class_index) {
  if (reports.empty()) {
    return Result<GlobalSchema>(ErrorCode::MPCInsufficientParticipants,
                                "no schema reports");
  }

  GlobalSchema schema;
  schema.row_count = reports.front().second.row_count;

  std::vector<bool> seen;
  for (const auto &[party_id, report] : reports) {
    if (report.row_count != schema.row_count) {
      return Result<GlobalSchema>(
          ErrorCode::DataSchemaMismatch,
          party_id + " holds " + std::to_string(report.row_count) +
              " rows, expected " + std::to_string(schema.row_count));
    }

    for (const auto &held : report.attributes) {
      if (held.global_index < 0) {
        return Result<GlobalSchema>(ErrorCode::DataSchemaMismatch,
                                    party_id + " reported a negative index");
      }
      size_t index = static_cast<size_t>(held.global_index);
      if (index >= schema.attributes.size()) {
        schema.attributes.resize(index + 1);
        schema.owners.resize(index + 1);
        schema.holders.resize(index + 1);
        seen.resize(index + 1, false);
      }

      if (!seen[index]) {
        seen[index] = true;
        schema.attributes[index] = held.metadata;
        schema.owners[index] = party_id;
      } else if (!(schema.attributes[index] == held.metadata)) {
        return Result<GlobalSchema>(
            ErrorCode::DataSchemaMismatch,
            "attribute " + std::to_string(index) + " differs between " +
                schema.owners[index] + " and " + party_id);
      }
      schema.holders[index].push_back(party_id);
    }
  }

  for (size_t i = 0; i < seen.size(); ++i) {
    if (!seen[i]) {
      return Result<GlobalSchema>(ErrorCode::DataSchemaMismatch,
                                  "attribute " + std::to_string(i) +
                                      " is held by no party");
    }
  }

  schema.class_index =
      class_index < 0 ? static_cast<int>(schema.attributes.size()) - 1
                      : class_index;
  if (schema.class_index < 0 ||
      static_cast<size_t>(schema.class_index) >= schema.attributes.size()) {
    return Result<GlobalSchema>(ErrorCode::DataSchemaMismatch,
                                "class column " +
                                    std::to_string(schema.class_index) +
                                    " is held by no party");
  }
  if (!schema.classAttribute().isNominal() ||
      schema.classAttribute().numValues() == 0) {
    return Result<GlobalSchema>(ErrorCode::DataSchemaMismatch,
                                "class attribute " +
                                    schema.classAttribute().name +
                                    " must be nominal");
  }

  DEBUG_INFO("Merged schema: " << schema.attributes.size() << " attributes, "
                               << schema.row_count << " rows, class "
                               << schema.classAttribute().name << " at "
                               << schema.classHolder());
  return schema;
}
