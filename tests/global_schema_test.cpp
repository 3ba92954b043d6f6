#include "core/global_schema.hpp"
#include "core/party_network.hpp"
#include "model/data_partition.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using vertree::ErrorCode;

namespace {

SchemaReport reportOf(const Dataset &dataset, const std::vector<int> &columns) {
  SchemaReport report;
  report.row_count = dataset.rows.size();
  for (int index : columns) {
    report.attributes.push_back(HeldAttribute{index, dataset.attributes[index]});
  }
  return report;
}

} // namespace

TEST(GlobalSchemaTest, MergesReportsInRingOrder) {
  Dataset dataset = fourRowDataset();
  auto schema = mergeSchemaReports(
      {{"party1", reportOf(dataset, {0})}, {"party2", reportOf(dataset, {1, 2})}},
      -1);
  ASSERT_TRUE(schema.isSuccess());
  const GlobalSchema &merged = schema.value();
  EXPECT_EQ(merged.numAttributes(), 3u);
  EXPECT_EQ(merged.class_index, 2);
  EXPECT_EQ(merged.numClasses(), 2);
  EXPECT_EQ(merged.classHolder(), "party2");
  EXPECT_EQ(merged.owners[0], "party1");
  EXPECT_TRUE(merged.holds("party2", 1));
  EXPECT_FALSE(merged.holds("party1", 1));
  EXPECT_EQ(merged.row_count, 4u);
}

TEST(GlobalSchemaTest, ContributorPrefersAHolderOfTheClass) {
  Dataset dataset = fourRowDataset();
  auto schema = mergeSchemaReports({{"party1", reportOf(dataset, {0, 1})},
                                    {"party2", reportOf(dataset, {1, 2})}},
                                   2);
  ASSERT_TRUE(schema.isSuccess());
  EXPECT_EQ(schema.value().owners[1], "party1");
  EXPECT_EQ(schema.value().contributorFor(1), "party2");
  // No holder of A has the class: the owner is named and will fail to tally
  EXPECT_EQ(schema.value().contributorFor(0), "party1");
}

TEST(GlobalSchemaTest, RowCountMismatchIsRejected) {
  Dataset dataset = fourRowDataset();
  auto shorter = reportOf(dataset, {1, 2});
  shorter.row_count = 3;
  auto schema = mergeSchemaReports(
      {{"party1", reportOf(dataset, {0})}, {"party2", shorter}}, 2);
  ASSERT_TRUE(schema.isError());
  EXPECT_EQ(schema.error(), ErrorCode::DataSchemaMismatch);
}

TEST(GlobalSchemaTest, DisagreeingMetadataIsRejected) {
  Dataset dataset = fourRowDataset();
  auto other = reportOf(dataset, {1, 2});
  other.attributes[1].metadata.nominal_values.push_back("2");
  auto schema = mergeSchemaReports(
      {{"party1", reportOf(dataset, {0, 2})}, {"party2", other}}, 2);
  ASSERT_TRUE(schema.isError());
  EXPECT_EQ(schema.error(), ErrorCode::DataSchemaMismatch);
}

TEST(GlobalSchemaTest, GapsAndNumericClassesAreRejected) {
  Dataset dataset = fourRowDataset();
  auto gap = mergeSchemaReports({{"party1", reportOf(dataset, {0, 2})}}, 2);
  ASSERT_TRUE(gap.isError());
  EXPECT_EQ(gap.error(), ErrorCode::DataSchemaMismatch);

  Dataset numeric_class = dataset;
  numeric_class.attributes[2] = numeric("class");
  auto schema = mergeSchemaReports(
      {{"party1", reportOf(numeric_class, {0, 1, 2})}}, 2);
  ASSERT_TRUE(schema.isError());
  EXPECT_EQ(schema.error(), ErrorCode::DataSchemaMismatch);
}

TEST(GlobalSchemaTest, ClassIndexResolvesAgainstThePartitioning) {
  std::vector<std::string> partitioning = {"0,2:party1", "1,3:party2"};
  auto count = attributeCountFromPartitioning(partitioning);
  ASSERT_TRUE(count.isSuccess());
  EXPECT_EQ(count.value(), 4);

  EXPECT_EQ(resolveClassIndex(-1, partitioning).value(), 3);
  EXPECT_EQ(resolveClassIndex(1, partitioning).value(), 1);
  auto outside = resolveClassIndex(4, partitioning);
  ASSERT_TRUE(outside.isError());
  EXPECT_EQ(outside.error(), ErrorCode::SystemInvalidConfiguration);

  EXPECT_TRUE(attributeCountFromPartitioning({"x:party1"}).isError());
}

TEST(GlobalSchemaTest, RoundsAskTheRightContributor) {
  Dataset dataset = fourRowDataset();
  auto schema = mergeSchemaReports({{"party1", reportOf(dataset, {0})},
                                    {"party2", reportOf(dataset, {1, 2})}},
                                   2);
  ASSERT_TRUE(schema.isSuccess());

  CountRoundPayload stats = statisticsRound(schema.value(), "r");
  EXPECT_EQ(stats.attribute_index, 2);
  EXPECT_EQ(stats.contributor_id, "party2");
  EXPECT_EQ(roundSlots(schema.value(), stats), 3u);

  auto round = attributeRound(schema.value(), "r", 1);
  ASSERT_TRUE(round.isSuccess());
  EXPECT_EQ(round.value().contributor_id, "party2");
  EXPECT_EQ(roundSlots(schema.value(), round.value()), 4u);

  auto class_round = attributeRound(schema.value(), "r", 2);
  ASSERT_TRUE(class_round.isError());
  EXPECT_EQ(class_round.error(), ErrorCode::DataSchemaMismatch);
}

TEST(GlobalSchemaTest, StatisticsDecodeClassCountsAndRows) {
  auto stats = decodeNodeStatistics({3, 5, 8}, 2);
  ASSERT_TRUE(stats.isSuccess());
  EXPECT_EQ(stats.value().class_counts, (std::vector<uint64_t>{3, 5}));
  EXPECT_EQ(stats.value().row_count, 8u);

  EXPECT_TRUE(decodeNodeStatistics({3, 5}, 2).isError());
}
