#pragma once
#include "core/party_network.hpp"
#include "core/tree_config.hpp"
#include "model/tree_node.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <memory>
#include <set>
#include <string>

struct BuildReport {
  uint64_t nodes_created = 0;
  uint64_t leaves = 0;
  uint64_t secure_sums = 0;
  uint64_t excluded_attributes = 0; // SchemaMismatch during a split search
  uint64_t aborted_branches = 0;    // protocol errors turned into leaves
};

// Depth-first C4.5-style growth over nominal attributes. Each call handles
// one tree node: node statistics, stopping criteria, one secure count pass
// per candidate attribute, gain ratio, split broadcast, recursion.
class DistributedTreeBuilder {
public:
  DistributedTreeBuilder(PartyNetwork &network, TreeConfig config);

  vertree::Result<std::unique_ptr<TreeNode>> build();

  const BuildReport &report() const { return report_; }

private:
  struct Candidate {
    int attribute_index = -1;
    double gain_ratio = -1.0;
  };

  // used_attributes is taken by value: siblings never share path state
  vertree::Result<std::unique_ptr<TreeNode>>
  buildNode(const std::string &node_id, std::set<int> used_attributes,
            int depth, const std::string &parent_majority);

  vertree::Result<Candidate> findBestSplit(const std::string &node_id,
                                           const std::set<int> &used_attributes);

  std::unique_ptr<TreeNode> makeLeaf(const std::string &node_id,
                                     const NodeStatistics &stats);

  // Leaf carrying the parent's majority and an all-zero tally
  std::unique_ptr<TreeNode> makeEmptyLeaf(const std::string &node_id,
                                          const std::string &parent_majority);

  PartyNetwork &network_;
  TreeConfig config_;
  BuildReport report_;
};

// Index of the largest count, lowest index on ties, -1 when all are zero
int majorityClass(const std::vector<uint64_t> &class_counts);
