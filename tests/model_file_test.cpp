#include "io/model_file.hpp"
#include "test_helpers.hpp"
#include "utils/error_codes.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

namespace {

std::unique_ptr<TreeNode> smallTree() {
  InternalNode split;
  split.attribute_index = 1;
  split.split_attribute = "B";
  split.value_labels = {"p", "q"};
  split.children.push_back(TreeNode::makeLeaf("r.0", "0", 0, {1, 1}));
  split.children.push_back(TreeNode::makeLeaf("r.1", "1", 1, {0, 2}));
  split.default_child = TreeNode::makeLeaf("r.d", "1", 1, {1, 3});

  auto root = std::make_unique<TreeNode>();
  root->id = kRootNodeId;
  root->body = std::move(split);
  return root;
}

} // namespace

TEST(ModelFileTest, SavedModelLoadsBack) {
  const std::string path = "vertree_model_test.json";
  Dataset dataset = fourRowDataset();
  auto tree = smallTree();

  auto saved = saveModel(path, *tree, dataset.attributes, dataset.class_index);
  ASSERT_TRUE(saved.isSuccess()) << saved.message();

  Model model = loadModel(path);
  std::remove(path.c_str());

  EXPECT_EQ(model.class_index, 2);
  ASSERT_EQ(model.attributes.size(), 3u);
  EXPECT_EQ(model.attributes[1], dataset.attributes[1]);
  ASSERT_NE(model.root, nullptr);
  EXPECT_EQ(formatTree(*model.root), formatTree(*tree));

  const InternalNode &root = model.root->internal();
  EXPECT_EQ(root.split_attribute, "B");
  EXPECT_FALSE(root.is_numeric);
  EXPECT_EQ(root.left, nullptr);
  ASSERT_NE(root.default_child, nullptr);
  EXPECT_EQ(root.default_child->leaf().class_distribution,
            (std::vector<uint64_t>{1, 3}));
}

TEST(ModelFileTest, NumericSplitsSurviveTheJsonForm) {
  InternalNode split;
  split.attribute_index = 0;
  split.split_attribute = "humidity";
  split.is_numeric = true;
  split.threshold = 0.25;
  split.left = TreeNode::makeLeaf("r.l", "yes", 1, {0, 3});
  split.right = TreeNode::makeLeaf("r.r", "no", 0, {2, 0});
  TreeNode root;
  root.id = kRootNodeId;
  root.body = std::move(split);

  auto restored = treeFromJson(treeToJson(root));
  ASSERT_FALSE(restored->isLeaf());
  EXPECT_TRUE(restored->internal().is_numeric);
  EXPECT_DOUBLE_EQ(restored->internal().threshold, 0.25);
  ASSERT_NE(restored->internal().right, nullptr);
  EXPECT_EQ(restored->internal().right->leaf().class_label, "no");
  EXPECT_EQ(restored->internal().default_child, nullptr);
}

TEST(ModelFileTest, BrokenFilesThrow) {
  using vertree::DataFormatError;
  EXPECT_THROW(loadModel("no-such-model.json"), DataFormatError);

  const std::string path = "vertree_broken_model_test.json";
  {
    std::ofstream out(path);
    out << R"({"attributes":[],"class_index":0,"tree":{"id":"r"}})";
  }
  EXPECT_THROW(loadModel(path), DataFormatError);
  std::remove(path.c_str());

  EXPECT_THROW(treeFromJson(nlohmann::json{{"id", "r"}, {"leaf", {{"x", 1}}}}),
               DataFormatError);
}

TEST(ModelFileTest, UnwritablePathIsReported) {
  auto tree = smallTree();
  auto saved = saveModel("/nonexistent-dir/model.json", *tree, {}, 0);
  ASSERT_TRUE(saved.isError());
  EXPECT_EQ(saved.error(), vertree::ErrorCode::SystemInvalidState);
}
