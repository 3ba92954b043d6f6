#include "core/tree_builder.hpp"
#include "io/model_file.hpp"
#include "io/tree_traversal.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using vertree::ErrorCode;

namespace {

TreeConfig configFrom(const std::map<std::string, std::string> &values) {
  auto config = TreeConfig::fromMap(values);
  EXPECT_TRUE(config.isSuccess());
  return config.value();
}

// Forwards to an in-process ring but fails chosen passes with a fixed error
class FailingNetwork : public PartyNetwork {
public:
  explicit FailingNetwork(LocalPartyNetwork &inner) : inner_(inner) {}

  std::string failing_statistics;
  std::string failing_counts;
  ErrorCode failure = ErrorCode::ProtocolSequenceError;

  const GlobalSchema &schema() const override { return inner_.schema(); }

  vertree::Result<NodeStatistics>
  nodeStatistics(const std::string &tree_node_id) override {
    if (tree_node_id == failing_statistics) {
      return vertree::Result<NodeStatistics>(failure, "injected");
    }
    return inner_.nodeStatistics(tree_node_id);
  }

  vertree::Result<CountMatrix> attributeCounts(const std::string &tree_node_id,
                                               int attribute_index) override {
    if (tree_node_id == failing_counts) {
      return vertree::Result<CountMatrix>(failure, "injected");
    }
    return inner_.attributeCounts(tree_node_id, attribute_index);
  }

  vertree::Result<void>
  splitNode(const std::string &tree_node_id, int attribute_index,
            const std::vector<std::string> &child_node_ids) override {
    return inner_.splitNode(tree_node_id, attribute_index, child_node_ids);
  }

  uint64_t secureSumsRun() const override { return inner_.secureSumsRun(); }

private:
  LocalPartyNetwork &inner_;
};

} // namespace

TEST(MajorityClassTest, LowestIndexWinsTies) {
  EXPECT_EQ(majorityClass({2, 5, 5}), 1);
  EXPECT_EQ(majorityClass({3, 3}), 0);
  EXPECT_EQ(majorityClass({0, 0, 0}), -1);
  EXPECT_EQ(majorityClass({}), -1);
}

TEST(TreeBuilderTest, RootSplitsOnTheAttributeHeldWithTheClass) {
  Dataset dataset = fourRowDataset();
  // party1: A, party2: B and the class
  auto setup = makeNetwork(dataset, {{0}, {1, 2}});
  std::map<std::string, std::string> options = {{"minInstances", "2"}};
  ASSERT_TRUE(
      setup.network->initiate("four-rows", setup.partitioning, options)
          .isSuccess());

  // Hand-computed gains: A and B tie at H(1/4, 3/4) - 0.5
  CountMatrix a_counts = {{1, 1}, {0, 2}};
  CountMatrix b_counts = {{1, 1}, {0, 2}};
  double gain_a = SecureInformationGain::informationGain(a_counts, 4);
  double gain_b = SecureInformationGain::informationGain(b_counts, 4);
  EXPECT_NEAR(gain_a, gain_b, 1e-12);
  EXPECT_GT(gain_b, 0.3);

  DistributedTreeBuilder builder(*setup.network, configFrom(options));
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess()) << tree.message();

  const TreeNode &root = *tree.value();
  ASSERT_FALSE(root.isLeaf());
  EXPECT_EQ(root.internal().split_attribute, "B");
  EXPECT_EQ(root.internal().attribute_index, 1);
  ASSERT_EQ(root.internal().children.size(), 2u);

  // party1 cannot tally A without the class column
  EXPECT_GE(builder.report().excluded_attributes, 1u);

  const TreeNode &p = *root.internal().children[0];
  const TreeNode &q = *root.internal().children[1];
  ASSERT_TRUE(p.isLeaf());
  ASSERT_TRUE(q.isLeaf());
  EXPECT_EQ(p.id, "r.0");
  EXPECT_EQ(p.leaf().class_distribution, (std::vector<uint64_t>{1, 1}));
  EXPECT_EQ(p.leaf().class_label, "0");
  EXPECT_EQ(q.leaf().class_label, "1");
  EXPECT_EQ(q.leaf().class_distribution, (std::vector<uint64_t>{0, 2}));

  ASSERT_NE(root.internal().default_child, nullptr);
  EXPECT_EQ(root.internal().default_child->leaf().class_label, "1");
  EXPECT_TRUE(isWellFormed(root));
}

TEST(TreeBuilderTest, HomogeneousNodeBecomesALeafAfterOneSum) {
  Dataset dataset = fourRowDataset();
  for (auto &row : dataset.rows) {
    row[2] = 1;
  }
  auto setup = makeNetwork(dataset, {{0, 2}, {1, 2}});
  ASSERT_TRUE(
      setup.network->initiate("same", setup.partitioning, {}).isSuccess());

  DistributedTreeBuilder builder(*setup.network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess());
  ASSERT_TRUE(tree.value()->isLeaf());
  EXPECT_EQ(tree.value()->leaf().class_label, "1");
  EXPECT_EQ(builder.report().secure_sums, 1u);
  EXPECT_EQ(builder.report().leaves, 1u);
}

TEST(TreeBuilderTest, ChildScopesPartitionTheParentRows) {
  Dataset dataset = outlookDataset();
  auto assignments = distributeAttributes(dataset, 2, true);
  auto setup = makeNetwork(dataset, assignments);
  ASSERT_TRUE(
      setup.network->initiate("outlook", setup.partitioning, {}).isSuccess());

  DistributedTreeBuilder builder(*setup.network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess()) << tree.message();
  ASSERT_FALSE(tree.value()->isLeaf());
  EXPECT_EQ(tree.value()->internal().split_attribute, "outlook");

  for (size_t i = 0; i < setup.network->partyCount(); ++i) {
    const LocalParty &party = setup.network->party(i);
    EXPECT_FALSE(party.scope(kRootNodeId).has_value());

    std::vector<uint32_t> all;
    for (int v = 0; v < 3; ++v) {
      auto rows = party.scope(childNodeId(kRootNodeId, v));
      ASSERT_TRUE(rows.has_value());
      EXPECT_EQ(rows->size(), 4u);
      all.insert(all.end(), rows->begin(), rows->end());
    }
    std::sort(all.begin(), all.end());
    ASSERT_EQ(all.size(), dataset.rows.size());
    for (size_t r = 0; r < all.size(); ++r) {
      EXPECT_EQ(all[r], r);
    }
  }

  EXPECT_DOUBLE_EQ(trainingAccuracy(*tree.value(), dataset), 1.0);
}

TEST(TreeBuilderTest, MissingSplitValuesReachNoChild) {
  Dataset dataset = outlookDataset();
  dataset.rows.push_back({kMissingValue, 0, 0, 1});
  auto setup = makeNetwork(dataset, distributeAttributes(dataset, 2, true));
  ASSERT_TRUE(
      setup.network->initiate("outlook", setup.partitioning, {}).isSuccess());

  DistributedTreeBuilder builder(*setup.network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess());
  ASSERT_FALSE(tree.value()->isLeaf());

  size_t scoped = 0;
  for (int v = 0; v < 3; ++v) {
    auto rows = setup.network->party(0).scope(childNodeId(kRootNodeId, v));
    ASSERT_TRUE(rows.has_value());
    scoped += rows->size();
  }
  EXPECT_EQ(scoped, dataset.rows.size() - 1);

  // The default child carries the root's majority
  const LeafNode *leaf = classifyRow(*tree.value(), dataset.rows.back());
  ASSERT_NE(leaf, nullptr);
  EXPECT_EQ(leaf->class_label, "yes");
}

TEST(TreeBuilderTest, StoppingCriteriaProduceARootLeaf) {
  Dataset dataset = outlookDataset();
  auto assignments = distributeAttributes(dataset, 2, true);

  for (const auto &options :
       std::vector<std::map<std::string, std::string>>{
           {{"maxDepth", "0"}}, {{"minInstances", "13"}}, {{"minGain", "0.9"}}}) {
    auto setup = makeNetwork(dataset, assignments);
    ASSERT_TRUE(
        setup.network->initiate("outlook", setup.partitioning, options)
            .isSuccess());
    DistributedTreeBuilder builder(*setup.network, configFrom(options));
    auto tree = builder.build();
    ASSERT_TRUE(tree.isSuccess());
    EXPECT_TRUE(tree.value()->isLeaf());
    EXPECT_EQ(tree.value()->leaf().class_label, "yes");
    EXPECT_EQ(tree.value()->leaf().class_distribution,
              (std::vector<uint64_t>{4, 8}));
  }
}

TEST(TreeBuilderTest, NumericAttributesAreNeverSplitOn) {
  Dataset dataset;
  dataset.attributes = {numeric("score"), nominal("label", {"lo", "hi"})};
  for (int i = 0; i < 10; ++i) {
    dataset.rows.push_back({i, i < 5 ? 0 : 1});
  }
  dataset.class_index = 1;
  auto setup = makeNetwork(dataset, {{0, 1}, {1}});
  ASSERT_TRUE(
      setup.network->initiate("scores", setup.partitioning, {}).isSuccess());

  DistributedTreeBuilder builder(*setup.network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess());
  EXPECT_TRUE(tree.value()->isLeaf());
}

TEST(TreeBuilderTest, TwoMemberRingIsRefusedByDefault) {
  Dataset dataset = outlookDataset();
  std::vector<int> everything = {0, 1, 2, 3};

  auto strict = makeNetwork(dataset, {everything});
  ASSERT_TRUE(
      strict.network->initiate("outlook", strict.partitioning, {}).isSuccess());
  DistributedTreeBuilder refused(*strict.network, TreeConfig());
  auto failed = refused.build();
  ASSERT_TRUE(failed.isError());
  EXPECT_EQ(failed.error(), ErrorCode::MPCInsufficientParticipants);

  std::map<std::string, std::string> options = {{"allowInsecureRing", "true"}};
  auto relaxed = makeNetwork(dataset, {everything});
  ASSERT_TRUE(relaxed.network->initiate("outlook", relaxed.partitioning, options)
                  .isSuccess());
  DistributedTreeBuilder allowed(*relaxed.network, configFrom(options));
  auto tree = allowed.build();
  ASSERT_TRUE(tree.isSuccess());
  EXPECT_FALSE(tree.value()->isLeaf());
}

TEST(TreeBuilderTest, BuiltTreeSurvivesAJsonRoundTrip) {
  Dataset dataset = outlookDataset();
  auto setup = makeNetwork(dataset, distributeAttributes(dataset, 3, true));
  ASSERT_TRUE(
      setup.network->initiate("outlook", setup.partitioning, {}).isSuccess());

  DistributedTreeBuilder builder(*setup.network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess());

  auto restored = treeFromJson(treeToJson(*tree.value()));
  EXPECT_EQ(formatTree(*restored), formatTree(*tree.value()));
  EXPECT_EQ(countNodes(*restored), countNodes(*tree.value()));
  for (const auto &row : dataset.rows) {
    const LeafNode *original = classifyRow(*tree.value(), row);
    const LeafNode *copy = classifyRow(*restored, row);
    ASSERT_NE(original, nullptr);
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(original->class_label, copy->class_label);
  }
}

TEST(TreeBuilderTest, SchemaMismatchRejectsTheSession) {
  Dataset dataset = outlookDataset();
  Dataset shorter = dataset;
  shorter.rows.pop_back();

  std::vector<std::unique_ptr<LocalParty>> parties;
  parties.push_back(
      std::make_unique<LocalParty>("party1", selectColumns(dataset, {0, 3})));
  parties.push_back(
      std::make_unique<LocalParty>("party2", selectColumns(shorter, {1, 2, 3})));
  LocalPartyNetwork network("coordinator", std::move(parties));

  auto initiated =
      network.initiate("outlook", {"0,3:party1", "1,2,3:party2"}, {});
  ASSERT_TRUE(initiated.isError());
  EXPECT_EQ(initiated.error(), ErrorCode::DataSchemaMismatch);
}

TEST(TreeBuilderTest, SequenceErrorInChildStatisticsCostsOnlyThatBranch) {
  Dataset dataset = outlookDataset();
  auto setup = makeNetwork(dataset, distributeAttributes(dataset, 2, true));
  ASSERT_TRUE(
      setup.network->initiate("outlook", setup.partitioning, {}).isSuccess());

  FailingNetwork network(*setup.network);
  network.failing_statistics = childNodeId(kRootNodeId, 1);
  DistributedTreeBuilder builder(network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess()) << tree.message();
  EXPECT_EQ(builder.report().aborted_branches, 1u);

  const TreeNode &root = *tree.value();
  ASSERT_FALSE(root.isLeaf());
  ASSERT_EQ(root.internal().children.size(), 3u);
  const TreeNode &aborted = *root.internal().children[1];
  ASSERT_TRUE(aborted.isLeaf());
  EXPECT_EQ(aborted.leaf().class_label, "yes");
  EXPECT_EQ(aborted.leaf().class_distribution, (std::vector<uint64_t>{0, 0}));

  const TreeNode &sunny = *root.internal().children[0];
  ASSERT_TRUE(sunny.isLeaf());
  EXPECT_EQ(sunny.leaf().class_label, "no");
  EXPECT_EQ(sunny.leaf().class_distribution, (std::vector<uint64_t>{4, 0}));
}

TEST(TreeBuilderTest, UnknownSessionInChildStatisticsCostsOnlyThatBranch) {
  Dataset dataset = outlookDataset();
  auto setup = makeNetwork(dataset, distributeAttributes(dataset, 2, true));
  ASSERT_TRUE(
      setup.network->initiate("outlook", setup.partitioning, {}).isSuccess());

  FailingNetwork network(*setup.network);
  network.failing_statistics = childNodeId(kRootNodeId, 2);
  network.failure = ErrorCode::ProtocolUnknownSession;
  DistributedTreeBuilder builder(network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess()) << tree.message();
  EXPECT_EQ(builder.report().aborted_branches, 1u);
  EXPECT_TRUE(tree.value()->internal().children[2]->isLeaf());
}

TEST(TreeBuilderTest, SequenceErrorInSplitSearchTurnsTheNodeIntoALeaf) {
  Dataset dataset = outlookDataset();
  auto setup = makeNetwork(dataset, distributeAttributes(dataset, 2, true));
  ASSERT_TRUE(
      setup.network->initiate("outlook", setup.partitioning, {}).isSuccess());

  FailingNetwork network(*setup.network);
  network.failing_counts = kRootNodeId;
  DistributedTreeBuilder builder(network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isSuccess()) << tree.message();
  EXPECT_EQ(builder.report().aborted_branches, 1u);
  ASSERT_TRUE(tree.value()->isLeaf());
  EXPECT_EQ(tree.value()->leaf().class_label, "yes");
  EXPECT_EQ(tree.value()->leaf().class_distribution,
            (std::vector<uint64_t>{4, 8}));
}

TEST(TreeBuilderTest, NetworkErrorInChildStatisticsFailsTheBuild) {
  Dataset dataset = outlookDataset();
  auto setup = makeNetwork(dataset, distributeAttributes(dataset, 2, true));
  ASSERT_TRUE(
      setup.network->initiate("outlook", setup.partitioning, {}).isSuccess());

  FailingNetwork network(*setup.network);
  network.failing_statistics = childNodeId(kRootNodeId, 1);
  network.failure = ErrorCode::NetworkTimeout;
  DistributedTreeBuilder builder(network, TreeConfig());
  auto tree = builder.build();
  ASSERT_TRUE(tree.isError());
  EXPECT_EQ(tree.error(), ErrorCode::NetworkTimeout);
}
