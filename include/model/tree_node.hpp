#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

struct TreeNode;

// Tree node ids are paths: "r", "r.0", "r.0.1"; the default child is "<id>.d"
inline const std::string kRootNodeId = "r";

inline std::string childNodeId(const std::string &parent, int value_index) {
  return parent + "." + std::to_string(value_index);
}

inline std::string defaultChildId(const std::string &parent) {
  return parent + ".d";
}

struct LeafNode {
  std::string class_label;
  int class_index = -1;
  std::vector<uint64_t> class_distribution;
};

// Split on one attribute. Nominal splits use `children` (one per nominal
// value); numeric splits use `left` (value <= threshold) and `right`. The
// default child takes rows whose value is missing or not indexed.
struct InternalNode {
  int attribute_index = -1;
  std::string split_attribute;
  bool is_numeric = false;
  double threshold = 0.0;
  std::vector<std::string> value_labels; // nominal value name per child

  std::vector<std::unique_ptr<TreeNode>> children;
  std::unique_ptr<TreeNode> left;
  std::unique_ptr<TreeNode> right;
  std::unique_ptr<TreeNode> default_child;

  InternalNode();
  ~InternalNode();
  InternalNode(InternalNode &&) noexcept;
  InternalNode &operator=(InternalNode &&) noexcept;

  const TreeNode *child(int value_index) const;
};

struct TreeNode {
  std::string id;
  std::variant<LeafNode, InternalNode> body;

  bool isLeaf() const { return std::holds_alternative<LeafNode>(body); }
  const LeafNode &leaf() const { return std::get<LeafNode>(body); }
  const InternalNode &internal() const { return std::get<InternalNode>(body); }
  InternalNode &internal() { return std::get<InternalNode>(body); }

  static std::unique_ptr<TreeNode> makeLeaf(std::string id,
                                            std::string class_label,
                                            int class_index,
                                            std::vector<uint64_t> distribution);
};

size_t countNodes(const TreeNode &node);
size_t countLeaves(const TreeNode &node);
int treeDepth(const TreeNode &node);

// Checks the shape invariants: nominal splits carry one child per value,
// numeric splits carry both sides, and every referenced child is present.
bool isWellFormed(const TreeNode &node, int expected_children = -1);

// Indented text rendering used by the CLI
std::string formatTree(const TreeNode &node);
