#pragma once
#include "model/attribute_metadata.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include <string>
#include <utility>
#include <vector>

// Coordinator's view of the vertically partitioned dataset, merged from the
// parties' schema reports. Attribute i has global index i.
struct GlobalSchema {
  std::vector<AttributeMetadata> attributes;
  std::vector<std::string> owners; // first party in ring order holding it
  std::vector<std::vector<std::string>> holders;
  int class_index = -1;
  uint64_t row_count = 0;

  size_t numAttributes() const { return attributes.size(); }
  int numClasses() const {
    return static_cast<int>(attributes.at(class_index).numValues());
  }
  const AttributeMetadata &classAttribute() const {
    return attributes.at(class_index);
  }
  const std::string &classHolder() const { return owners.at(class_index); }
  bool holds(const std::string &party_id, int global_index) const;

  // Party that tallies the attribute: the first holder that also holds the
  // class column, or the owner when no holder does.
  const std::string &contributorFor(int global_index) const;
};

// Number of attributes named by a set of "<csv-indices>:<partyId>" entries
vertree::Result<int>
attributeCountFromPartitioning(const std::vector<std::string> &partitioning);

// Turns -1 into the last attribute of the partitioning
vertree::Result<int>
resolveClassIndex(int class_index,
                  const std::vector<std::string> &partitioning);

// Reports are given in ring order. Fails with DataSchemaMismatch when row
// counts differ, an attribute is reported twice with different metadata, a
// global index is held by nobody, or the class column is missing or numeric.
vertree::Result<GlobalSchema> mergeSchemaReports(
    const std::vector<std::pair<std::string, SchemaReport>> &reports,
    int class_index);
