#pragma once
#include "core/global_schema.hpp"
#include "mpc/secure_information_gain.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Class tally and row count of the rows that reached one tree node
struct NodeStatistics {
  std::vector<uint64_t> class_counts;
  uint64_t row_count = 0;
};

// What the tree builder needs from the parties. Every count it returns was
// obtained through a full secure-sum ring pass; only the coordinator side
// sees the revealed totals.
class PartyNetwork {
public:
  virtual ~PartyNetwork() = default;

  virtual const GlobalSchema &schema() const = 0;

  virtual vertree::Result<NodeStatistics>
  nodeStatistics(const std::string &tree_node_id) = 0;

  // Global attribute x class counts over the node's rows
  virtual vertree::Result<CountMatrix>
  attributeCounts(const std::string &tree_node_id, int attribute_index) = 0;

  // Tells every party to replace the node's row scope by one scope per child
  virtual vertree::Result<void>
  splitNode(const std::string &tree_node_id, int attribute_index,
            const std::vector<std::string> &child_node_ids) = 0;

  virtual uint64_t secureSumsRun() const = 0;
};

// Count round asking for the class tally of a node; the first class holder
// contributes
CountRoundPayload statisticsRound(const GlobalSchema &schema,
                                  const std::string &tree_node_id);

// Count round for one nominal attribute; DataSchemaMismatch when the
// attribute cannot be counted
vertree::Result<CountRoundPayload> attributeRound(const GlobalSchema &schema,
                                                  const std::string &tree_node_id,
                                                  int attribute_index);

// Number of secure-sum slots a round needs
size_t roundSlots(const GlobalSchema &schema, const CountRoundPayload &round);

// Splits a finalized statistics vector (class counts, then the row count)
vertree::Result<NodeStatistics>
decodeNodeStatistics(const std::vector<uint64_t> &sums, int num_classes);
