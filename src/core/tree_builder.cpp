#include "core/tree_builder.hpp"
#include "utils/logging.hpp"

using vertree::ErrorCode;
using vertree::Result;

int majorityClass(const std::vector<uint64_t> &class_counts) {
  int best = -1;
  uint64_t best_count = 0;
  for (size_t c = 0; c < class_counts.size(); ++c) {
    if (class_counts[c] > best_count) {
      best = static_cast<int>(c);
      best_count = class_counts[c];
    }
  }
  return best;
}

namespace {

// Errors that cost one branch rather than the whole tree
bool abortsBranch(ErrorCode code) {
  return code == ErrorCode::ProtocolSequenceError ||
         code == ErrorCode::ProtocolUnknownSession;
}

} // namespace

DistributedTreeBuilder::DistributedTreeBuilder(PartyNetwork &network,
                                               TreeConfig config)
    : network_(network), config_(config) {}

Result<std::unique_ptr<TreeNode>> DistributedTreeBuilder::build() {
  report_ = BuildReport{};
  uint64_t sums_before = network_.secureSumsRun();

  const auto &schema = network_.schema();
  const auto &classes = schema.classAttribute().nominal_values;
  auto root = buildNode(kRootNodeId, {}, 0, classes.empty() ? "" : classes[0]);

  report_.secure_sums = network_.secureSumsRun() - sums_before;
  if (root.isSuccess()) {
    LOG("Tree built: " << report_.nodes_created << " nodes, "
                       << report_.leaves << " leaves, " << report_.secure_sums
                       << " secure sums");
  }
  return root;
}

std::unique_ptr<TreeNode>
DistributedTreeBuilder::makeLeaf(const std::string &node_id,
                                 const NodeStatistics &stats) {
  const auto &classes = network_.schema().classAttribute().nominal_values;
  int majority = majorityClass(stats.class_counts);
  std::string label =
      majority >= 0 ? classes.at(majority) : (classes.empty() ? "" : classes[0]);

  report_.nodes_created++;
  report_.leaves++;
  return TreeNode::makeLeaf(node_id, label, majority >= 0 ? majority : 0,
                            stats.class_counts);
}

std::unique_ptr<TreeNode>
DistributedTreeBuilder::makeEmptyLeaf(const std::string &node_id,
                                      const std::string &parent_majority) {
  const auto &class_attribute = network_.schema().classAttribute();
  int index = class_attribute.valueIndex(parent_majority);
  report_.nodes_created++;
  report_.leaves++;
  return TreeNode::makeLeaf(
      node_id, parent_majority, index >= 0 ? index : 0,
      std::vector<uint64_t>(class_attribute.nominal_values.size(), 0));
}

Result<std::unique_ptr<TreeNode>>
DistributedTreeBuilder::buildNode(const std::string &node_id,
                                  std::set<int> used_attributes, int depth,
                                  const std::string &parent_majority) {
  auto stats = network_.nodeStatistics(node_id);
  if (stats.isError()) {
    if (abortsBranch(stats.error())) {
      LOG_ERROR("Statistics of " << node_id << " aborted: " << stats.message());
      report_.aborted_branches++;
      return makeEmptyLeaf(node_id, parent_majority);
    }
    return Result<std::unique_ptr<TreeNode>>(stats.error(), stats.message());
  }
  const NodeStatistics &node_stats = stats.value();
  const auto &schema = network_.schema();

  // An empty child takes the parent's majority with an all-zero tally
  if (node_stats.row_count == 0) {
    return makeEmptyLeaf(node_id, parent_majority);
  }

  size_t observed_classes = 0;
  for (uint64_t n : node_stats.class_counts) {
    if (n > 0) {
      observed_classes++;
    }
  }

  if (depth >= config_.max_depth ||
      node_stats.row_count < static_cast<uint64_t>(config_.min_instances) ||
      observed_classes <= 1 ||
      used_attributes.size() + 1 >= schema.numAttributes()) {
    DEBUG_DEBUG("Leaf at " << node_id << " (depth " << depth << ", "
                           << node_stats.row_count << " rows)");
    return makeLeaf(node_id, node_stats);
  }

  auto best = findBestSplit(node_id, used_attributes);
  if (best.isError()) {
    if (abortsBranch(best.error())) {
      LOG_ERROR("Split search at " << node_id << " aborted: "
                                   << best.message());
      report_.aborted_branches++;
      return makeLeaf(node_id, node_stats);
    }
    return Result<std::unique_ptr<TreeNode>>(best.error(), best.message());
  }

  const Candidate &winner = best.value();
  if (winner.attribute_index < 0 || winner.gain_ratio < config_.min_gain) {
    return makeLeaf(node_id, node_stats);
  }

  const auto &attribute = schema.attributes[winner.attribute_index];
  std::vector<std::string> child_ids;
  for (int v = 0; v < attribute.numValues(); ++v) {
    child_ids.push_back(childNodeId(node_id, v));
  }

  auto split = network_.splitNode(node_id, winner.attribute_index, child_ids);
  if (split.isError()) {
    if (abortsBranch(split.error())) {
      LOG_ERROR("Split of " << node_id << " aborted: " << split.message());
      report_.aborted_branches++;
      return makeLeaf(node_id, node_stats);
    }
    return Result<std::unique_ptr<TreeNode>>(split.error(), split.message());
  }

  DEBUG_INFO("Split " << node_id << " on " << attribute.name
                      << " (gain ratio " << winner.gain_ratio << ")");

  auto node = std::make_unique<TreeNode>();
  node->id = node_id;
  InternalNode internal;
  internal.attribute_index = winner.attribute_index;
  internal.split_attribute = attribute.name;
  internal.value_labels = attribute.nominal_values;

  // Rows with a missing value reach no child; the default child covers them
  internal.default_child = makeLeaf(defaultChildId(node_id), node_stats);
  const std::string &majority = internal.default_child->leaf().class_label;

  std::set<int> child_used = used_attributes;
  child_used.insert(winner.attribute_index);
  for (const auto &child_id : child_ids) {
    auto child = buildNode(child_id, child_used, depth + 1, majority);
    if (child.isError()) {
      return child;
    }
    internal.children.push_back(child.moveValue());
  }

  node->body = std::move(internal);
  report_.nodes_created++;
  return Result<std::unique_ptr<TreeNode>>(std::move(node));
}

Result<DistributedTreeBuilder::Candidate>
DistributedTreeBuilder::findBestSplit(const std::string &node_id,
                                      const std::set<int> &used_attributes) {
  const auto &schema = network_.schema();
  Candidate best;

  for (size_t a = 0; a < schema.numAttributes(); ++a) {
    int index = static_cast<int>(a);
    if (index == schema.class_index || used_attributes.count(index) > 0 ||
        !schema.attributes[a].isNominal()) {
      continue;
    }

    auto counts = network_.attributeCounts(node_id, index);
    if (counts.isError()) {
      if (counts.error() == ErrorCode::DataSchemaMismatch) {
        DEBUG_WARN("Excluding " << schema.attributes[a].name << " at "
                                << node_id << ": " << counts.message());
        report_.excluded_attributes++;
        continue;
      }
      return Result<Candidate>(counts.error(), counts.message());
    }

    uint64_t total = 0;
    for (const auto &row : counts.value()) {
      for (uint64_t n : row) {
        total += n;
      }
    }

    double gain = SecureInformationGain::informationGain(counts.value(), total);
    double ratio = SecureInformationGain::gainRatio(gain, counts.value(), total);
    DEBUG_DEBUG(node_id << ": " << schema.attributes[a].name << " gain "
                        << gain << " ratio " << ratio);

    // Strictly greater: the first attribute in scan order wins ties
    if (ratio > best.gain_ratio) {
      best.attribute_index = index;
      best.gain_ratio = ratio;
    }
  }

  return best;
}
