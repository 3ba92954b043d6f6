#include "core/party_network.hpp"

using vertree::ErrorCode;
using vertree::Result;

Result<NodeStatistics> decodeNodeStatistics(const std::vector<uint64_t> &sums,
                                            int num_classes) {
  if (num_classes <= 0 || sums.size() != static_cast<size_t>(num_classes) + 1) {
    return Result<NodeStatistics>(ErrorCode::DataSchemaMismatch,
                                  "statistics vector of " +
                                      std::to_string(sums.size()) +
                                      " slots for " +
                                      std::to_string(num_classes) + " classes");
  }

  NodeStatistics stats;
  stats.class_counts.assign(sums.begin(), sums.end() - 1);
  stats.row_count = sums.back();
  return stats;
}

CountRoundPayload statisticsRound(const GlobalSchema &schema,
                                  const std::string &tree_node_id) {
  CountRoundPayload round;
  round.tree_node_id = tree_node_id;
  round.attribute_index = schema.class_index;
  round.contributor_id = schema.classHolder();
  round.num_attribute_values = 1;
  round.num_class_values = schema.numClasses();
  return round;
}

Result<CountRoundPayload> attributeRound(const GlobalSchema &schema,
                                         const std::string &tree_node_id,
                                         int attribute_index) {
  if (attribute_index < 0 ||
      static_cast<size_t>(attribute_index) >= schema.numAttributes() ||
      attribute_index == schema.class_index ||
      !schema.attributes[attribute_index].isNominal()) {
    return Result<CountRoundPayload>(ErrorCode::DataSchemaMismatch,
                                     "attribute " +
                                         std::to_string(attribute_index) +
                                         " cannot be counted");
  }

  CountRoundPayload round;
  round.tree_node_id = tree_node_id;
  round.attribute_index = attribute_index;
  round.contributor_id = schema.contributorFor(attribute_index);
  round.num_attribute_values = schema.attributes[attribute_index].numValues();
  round.num_class_values = schema.numClasses();
  return round;
}

size_t roundSlots(const GlobalSchema &schema, const CountRoundPayload &round) {
  if (round.attribute_index == schema.class_index) {
    return static_cast<size_t>(round.num_class_values) + 1;
  }
  return static_cast<size_t>(round.num_attribute_values) *
         static_cast<size_t>(round.num_class_values);
}
