#pragma once
#include "model/attribute_metadata.hpp"
#include "model/tree_node.hpp"
#include "utils/error_codes.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// A trained tree together with the schema needed to read prediction input
struct Model {
  std::vector<AttributeMetadata> attributes;
  int class_index = -1;
  std::unique_ptr<TreeNode> root;
};

nlohmann::json treeToJson(const TreeNode &node);
// Throws vertree::DataFormatError on a malformed tree
std::unique_ptr<TreeNode> treeFromJson(const nlohmann::json &j);

vertree::Result<void> saveModel(const std::string &path, const TreeNode &root,
                                const std::vector<AttributeMetadata> &attributes,
                                int class_index);
// Throws vertree::DataFormatError
Model loadModel(const std::string &path);
