#include "model/tree_node.hpp"
#include <algorithm>
#include <sstream>

InternalNode::InternalNode() = default;
InternalNode::~InternalNode() = default;
InternalNode::InternalNode(InternalNode &&) noexcept = default;
InternalNode &InternalNode::operator=(InternalNode &&) noexcept = default;

const TreeNode *InternalNode::child(int value_index) const {
  if (value_index < 0 || value_index >= static_cast<int>(children.size())) {
    return nullptr;
  }
  return children[value_index].get();
}

std::unique_ptr<TreeNode> TreeNode::makeLeaf(std::string id,
                                             std::string class_label,
                                             int class_index,
                                             std::vector<uint64_t> distribution) {
  auto node = std::make_unique<TreeNode>();
  node->id = std::move(id);
  LeafNode leaf;
  leaf.class_label = std::move(class_label);
  leaf.class_index = class_index;
  leaf.class_distribution = std::move(distribution);
  node->body = std::move(leaf);
  return node;
}

namespace {

template <typename Visitor>
void forEachChild(const InternalNode &split, Visitor &&visit) {
  for (const auto &child : split.children) {
    if (child) visit(*child);
  }
  if (split.left) visit(*split.left);
  if (split.right) visit(*split.right);
  if (split.default_child) visit(*split.default_child);
}

void formatNode(const TreeNode &node, int indent, std::ostringstream &out) {
  std::string pad(static_cast<size_t>(indent) * 2, ' ');
  if (node.isLeaf()) {
    const auto &leaf = node.leaf();
    out << pad << "-> " << leaf.class_label << " [";
    for (size_t i = 0; i < leaf.class_distribution.size(); ++i) {
      if (i > 0) out << ",";
      out << leaf.class_distribution[i];
    }
    out << "]\n";
    return;
  }

  const auto &split = node.internal();
  if (split.is_numeric) {
    out << pad << split.split_attribute << " <= " << split.threshold << "\n";
    if (split.left) formatNode(*split.left, indent + 1, out);
    out << pad << split.split_attribute << " > " << split.threshold << "\n";
    if (split.right) formatNode(*split.right, indent + 1, out);
  } else {
    for (size_t i = 0; i < split.children.size(); ++i) {
      out << pad << split.split_attribute << " = ";
      if (i < split.value_labels.size()) {
        out << split.value_labels[i] << "\n";
      } else {
        out << "#" << i << "\n";
      }
      if (split.children[i]) formatNode(*split.children[i], indent + 1, out);
    }
  }
  if (split.default_child) {
    out << pad << split.split_attribute << " = ?\n";
    formatNode(*split.default_child, indent + 1, out);
  }
}

} // namespace

size_t countNodes(const TreeNode &node) {
  if (node.isLeaf()) {
    return 1;
  }
  size_t total = 1;
  forEachChild(node.internal(),
               [&total](const TreeNode &child) { total += countNodes(child); });
  return total;
}

size_t countLeaves(const TreeNode &node) {
  if (node.isLeaf()) {
    return 1;
  }
  size_t total = 0;
  forEachChild(node.internal(), [&total](const TreeNode &child) {
    total += countLeaves(child);
  });
  return total;
}

int treeDepth(const TreeNode &node) {
  if (node.isLeaf()) {
    return 0;
  }
  int deepest = 0;
  forEachChild(node.internal(), [&deepest](const TreeNode &child) {
    deepest = std::max(deepest, treeDepth(child));
  });
  return deepest + 1;
}

bool isWellFormed(const TreeNode &node, int expected_children) {
  if (node.isLeaf()) {
    return true;
  }

  const auto &split = node.internal();
  if (split.is_numeric) {
    if (!split.left || !split.right || !split.children.empty()) {
      return false;
    }
  } else {
    if (split.children.empty() || split.left || split.right) {
      return false;
    }
    if (expected_children >= 0 &&
        static_cast<int>(split.children.size()) != expected_children) {
      return false;
    }
    for (const auto &child : split.children) {
      if (!child) {
        return false;
      }
    }
  }

  bool ok = true;
  forEachChild(split, [&ok](const TreeNode &child) {
    ok = ok && isWellFormed(child);
  });
  return ok;
}

std::string formatTree(const TreeNode &node) {
  std::ostringstream out;
  formatNode(node, 0, out);
  return out.str();
}
