#include "io/tree_traversal.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace {

std::unique_ptr<TreeNode> leaf(const std::string &id, const std::string &label,
                               int index) {
  return TreeNode::makeLeaf(id, label, index, {});
}

// outlook: sunny -> (humidity <= 0.7 ? yes : no), overcast -> yes,
// rain -> no; default -> yes
std::unique_ptr<TreeNode> sampleTree() {
  InternalNode humidity;
  humidity.attribute_index = 1;
  humidity.split_attribute = "humidity";
  humidity.is_numeric = true;
  humidity.threshold = 0.7;
  humidity.left = leaf("r.0.l", "yes", 1);
  humidity.right = leaf("r.0.r", "no", 0);
  humidity.default_child = leaf("r.0.d", "no", 0);

  auto sunny = std::make_unique<TreeNode>();
  sunny->id = "r.0";
  sunny->body = std::move(humidity);

  InternalNode outlook;
  outlook.attribute_index = 0;
  outlook.split_attribute = "outlook";
  outlook.value_labels = {"sunny", "overcast", "rain"};
  outlook.children.push_back(std::move(sunny));
  outlook.children.push_back(leaf("r.1", "yes", 1));
  outlook.children.push_back(leaf("r.2", "no", 0));
  outlook.default_child = leaf("r.d", "yes", 1);

  auto root = std::make_unique<TreeNode>();
  root->id = kRootNodeId;
  root->body = std::move(outlook);
  return root;
}

} // namespace

TEST(TraversalTest, FollowsNominalAndNumericSplits) {
  auto root = sampleTree();
  EXPECT_EQ(classify(*root, {{"outlook", 0}, {"humidity", 0.5}})->class_label,
            "yes");
  EXPECT_EQ(classify(*root, {{"outlook", 0}, {"humidity", 0.7}})->class_label,
            "yes");
  EXPECT_EQ(classify(*root, {{"outlook", 0}, {"humidity", 0.9}})->class_label,
            "no");
  EXPECT_EQ(classify(*root, {{"outlook", 2}})->class_label, "no");
}

TEST(TraversalTest, NominalValueIsRoundedToAChild) {
  auto root = sampleTree();
  EXPECT_EQ(classify(*root, {{"outlook", 1.2}})->class_label, "yes");
  EXPECT_EQ(classify(*root, {{"outlook", 1.6}})->class_label, "no");
}

TEST(TraversalTest, MissingOrUnindexedValuesUseTheDefaultChild) {
  auto root = sampleTree();
  EXPECT_EQ(classify(*root, {})->id, "r.d");
  EXPECT_EQ(classify(*root, {{"outlook", 7}})->id, "r.d");
  EXPECT_EQ(classify(*root, {{"outlook", 0}})->id, "r.0.d");
  EXPECT_EQ(classifyRow(*root, {kMissingValue, 3})->id, "r.d");
  EXPECT_EQ(classifyRow(*root, {1})->id, "r.1");
}

TEST(TraversalTest, NonFiniteAndHugeValuesUseTheDefaultChild) {
  auto root = sampleTree();
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  EXPECT_EQ(classify(*root, {{"outlook", 1e300}})->id, "r.d");
  EXPECT_EQ(classify(*root, {{"outlook", -1e300}})->id, "r.d");
  EXPECT_EQ(classify(*root, {{"outlook", nan}})->id, "r.d");
  EXPECT_EQ(classify(*root, {{"outlook", inf}})->id, "r.d");
  EXPECT_EQ(classify(*root, {{"outlook", -2.0}})->id, "r.d");
  EXPECT_EQ(classify(*root, {{"outlook", 0}, {"humidity", nan}})->id, "r.0.d");
  EXPECT_EQ(classify(*root, {{"outlook", 0}, {"humidity", -inf}})->id, "r.0.d");
}

TEST(TraversalTest, AbsentDefaultBranchYieldsNull) {
  auto root = sampleTree();
  root->internal().default_child.reset();
  EXPECT_EQ(classify(*root, {}), nullptr);
}

TEST(TraversalTest, TrainingAccuracyCountsLabelledRows) {
  auto root = sampleTree();
  Dataset dataset;
  dataset.attributes = {nominal("outlook", {"sunny", "overcast", "rain"}),
                        nominal("play", {"no", "yes"})};
  dataset.class_index = 1;
  // The last row has no class and is not counted
  dataset.rows = {{1, 1}, {2, 0}, {2, 1}, {0, kMissingValue}};
  EXPECT_DOUBLE_EQ(trainingAccuracy(*root, dataset), 2.0 / 3.0);
}
