#include "io/model_file.hpp"
#include "utils/logging.hpp"
#include <fstream>

using vertree::DataFormatError;
using vertree::ErrorCode;
using vertree::Result;

namespace {

nlohmann::json optionalChild(const std::unique_ptr<TreeNode> &child) {
  return child ? treeToJson(*child) : nlohmann::json(nullptr);
}

std::unique_ptr<TreeNode> optionalChild(const nlohmann::json &j,
                                        const char *key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return nullptr;
  }
  return treeFromJson(j.at(key));
}

} // namespace

nlohmann::json treeToJson(const TreeNode &node) {
  nlohmann::json j{{"id", node.id}};
  if (node.isLeaf()) {
    const LeafNode &leaf = node.leaf();
    j["leaf"] = {{"class_label", leaf.class_label},
                 {"class_index", leaf.class_index},
                 {"class_distribution", leaf.class_distribution}};
    return j;
  }

  const InternalNode &split = node.internal();
  nlohmann::json children = nlohmann::json::array();
  for (const auto &child : split.children) {
    children.push_back(optionalChild(child));
  }
  j["split"] = {{"attribute_index", split.attribute_index},
                {"split_attribute", split.split_attribute},
                {"is_numeric", split.is_numeric},
                {"threshold", split.threshold},
                {"value_labels", split.value_labels},
                {"children", children},
                {"left", optionalChild(split.left)},
                {"right", optionalChild(split.right)},
                {"default", optionalChild(split.default_child)}};
  return j;
}

std::unique_ptr<TreeNode> treeFromJson(const nlohmann::json &j) {
  try {
    auto node = std::make_unique<TreeNode>();
    j.at("id").get_to(node->id);

    if (j.contains("leaf")) {
      const auto &l = j.at("leaf");
      LeafNode leaf;
      l.at("class_label").get_to(leaf.class_label);
      l.at("class_index").get_to(leaf.class_index);
      l.at("class_distribution").get_to(leaf.class_distribution);
      node->body = std::move(leaf);
      return node;
    }

    const auto &s = j.at("split");
    InternalNode split;
    s.at("attribute_index").get_to(split.attribute_index);
    s.at("split_attribute").get_to(split.split_attribute);
    s.at("is_numeric").get_to(split.is_numeric);
    s.at("threshold").get_to(split.threshold);
    s.at("value_labels").get_to(split.value_labels);
    for (const auto &child : s.at("children")) {
      split.children.push_back(child.is_null() ? nullptr : treeFromJson(child));
    }
    split.left = optionalChild(s, "left");
    split.right = optionalChild(s, "right");
    split.default_child = optionalChild(s, "default");
    node->body = std::move(split);
    return node;
  } catch (const nlohmann::json::exception &e) {
    throw DataFormatError(std::string("Malformed tree node: ") + e.what());
  }
}

Result<void> saveModel(const std::string &path, const TreeNode &root,
                       const std::vector<AttributeMetadata> &attributes,
                       int class_index) {
  nlohmann::json j{{"attributes", attributes},
                   {"class_index", class_index},
                   {"tree", treeToJson(root)}};

  std::ofstream file(path);
  if (!file.is_open()) {
    return Result<void>(ErrorCode::SystemInvalidState,
                        "cannot write model file " + path);
  }
  file << j.dump(2) << "\n";
  if (!file.good()) {
    return Result<void>(ErrorCode::SystemInvalidState,
                        "write to " + path + " failed");
  }
  return Result<void>();
}

Model loadModel(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw DataFormatError("Cannot open model file " + path);
  }

  Model model;
  try {
    nlohmann::json j;
    file >> j;
    j.at("attributes").get_to(model.attributes);
    j.at("class_index").get_to(model.class_index);
    model.root = treeFromJson(j.at("tree"));
  } catch (const nlohmann::json::exception &e) {
    throw DataFormatError("Malformed model file " + path + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw DataFormatError("Malformed model file " + path + ": " + e.what());
  }

  if (model.class_index < 0 ||
      model.class_index >= static_cast<int>(model.attributes.size())) {
    throw DataFormatError("Model file " + path + " has no valid class index");
  }
  DEBUG_INFO("Loaded model from " << path << " (" << countNodes(*model.root)
                                  << " nodes)");
  return model;
}
