#include "io/tree_traversal.hpp"
#include <cmath>
#include <optional>

namespace {

template <typename Lookup>
const LeafNode *descend(const TreeNode &root, Lookup lookup) {
  const TreeNode *node = &root;
  while (node != nullptr && !node->isLeaf()) {
    const InternalNode &split = node->internal();
    std::optional<double> value = lookup(split);

    // NaN and infinities are treated as missing
    const TreeNode *next = nullptr;
    if (!value || !std::isfinite(*value)) {
      next = split.default_child.get();
    } else if (split.is_numeric) {
      next = *value <= split.threshold ? split.left.get() : split.right.get();
    } else {
      double index = std::round(*value);
      if (index >= 0.0 && index < static_cast<double>(split.children.size())) {
        next = split.child(static_cast<int>(index));
      }
      if (next == nullptr) {
        next = split.default_child.get();
      }
    }
    node = next;
  }
  return node == nullptr ? nullptr : &node->leaf();
}

} // namespace

const LeafNode *classify(const TreeNode &root, const FeatureValues &features) {
  return descend(root, [&features](const InternalNode &split) {
    std::optional<double> value;
    auto it = features.find(split.split_attribute);
    if (it != features.end()) {
      value = it->second;
    }
    return value;
  });
}

const LeafNode *classifyRow(const TreeNode &root, const std::vector<int> &row) {
  return descend(root, [&row](const InternalNode &split) {
    std::optional<double> value;
    if (split.attribute_index >= 0 &&
        static_cast<size_t>(split.attribute_index) < row.size() &&
        row[split.attribute_index] != kMissingValue) {
      value = row[split.attribute_index];
    }
    return value;
  });
}

double trainingAccuracy(const TreeNode &root, const Dataset &dataset) {
  size_t labelled = 0;
  size_t correct = 0;
  for (const auto &row : dataset.rows) {
    if (dataset.class_index < 0 ||
        static_cast<size_t>(dataset.class_index) >= row.size() ||
        row[dataset.class_index] == kMissingValue) {
      continue;
    }
    ++labelled;
    const LeafNode *leaf = classifyRow(root, row);
    if (leaf != nullptr && leaf->class_index == row[dataset.class_index]) {
      ++correct;
    }
  }
  return labelled == 0 ? 0.0
                       : static_cast<double>(correct) / static_cast<double>(labelled);
}
