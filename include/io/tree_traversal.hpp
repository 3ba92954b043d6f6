#pragma once
#include "io/values_parser.hpp"
#include "model/data_partition.hpp"
#include "model/tree_node.hpp"
#include <vector>

// Walks the tree to a leaf. A missing feature, or a nominal value with no
// child, follows the default child. Returns nullptr when that branch is
// absent.
const LeafNode *classify(const TreeNode &root, const FeatureValues &features);

// Same walk over a full dataset row (kMissingValue for missing cells)
const LeafNode *classifyRow(const TreeNode &root, const std::vector<int> &row);

// Fraction of rows with a known class that the tree labels correctly
double trainingAccuracy(const TreeNode &root, const Dataset &dataset);
