#include "mpc/secure_information_gain.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <random>

using vertree::ErrorCode;

namespace {

double entropy(std::initializer_list<double> probabilities) {
  double h = 0.0;
  for (double p : probabilities) {
    if (p > 0.0) h -= p * std::log2(p);
  }
  return h;
}

} // namespace

TEST(InformationGainTest, PerfectAttributeGainsTheClassEntropy) {
  // value 0 -> class 0, value 1 -> class 1, 2 rows each
  CountMatrix counts = {{2, 0}, {0, 2}};
  double gain = SecureInformationGain::informationGain(counts, 4);
  EXPECT_NEAR(gain, 1.0, 1e-12);
  EXPECT_NEAR(SecureInformationGain::gainRatio(gain, counts, 4), 1.0, 1e-12);
}

TEST(InformationGainTest, IndependentAttributeGainsNothing) {
  CountMatrix counts = {{1, 1}, {1, 1}};
  double gain = SecureInformationGain::informationGain(counts, 4);
  EXPECT_NEAR(gain, 0.0, 1e-12);
  EXPECT_GE(gain, 0.0);
}

TEST(InformationGainTest, MatchesHandComputedValue) {
  // B in the four-row example: p -> {0:1, 1:1}, q -> {0:0, 1:2}
  CountMatrix counts = {{1, 1}, {0, 2}};
  double expected = entropy({0.25, 0.75}) - 0.5 * 1.0;
  double gain = SecureInformationGain::informationGain(counts, 4);
  EXPECT_NEAR(gain, expected, 1e-12);
  EXPECT_NEAR(SecureInformationGain::splitInformation(counts, 4), 1.0, 1e-12);
}

TEST(InformationGainTest, GainStaysWithinClassEntropy) {
  CountMatrix counts = {{3, 1, 0}, {0, 2, 2}, {1, 0, 5}};
  uint64_t total = 14;
  double class_entropy =
      entropy({4.0 / total, 3.0 / total, 7.0 / total});
  double gain = SecureInformationGain::informationGain(counts, total);
  EXPECT_GE(gain, 0.0);
  EXPECT_LE(gain, class_entropy + 1e-12);
}

TEST(InformationGainTest, GainIsBoundedForRandomMatrices) {
  std::mt19937 rng(7);
  std::uniform_int_distribution<int> size(1, 6);
  std::uniform_int_distribution<uint64_t> count(0, 25);

  for (int trial = 0; trial < 500; ++trial) {
    int values = size(rng);
    int classes = size(rng) + 1;
    CountMatrix counts(values, std::vector<uint64_t>(classes, 0));
    uint64_t total = 0;
    for (auto &row : counts) {
      for (auto &n : row) {
        // Sparse matrices: about a third of the cells stay empty
        n = rng() % 3 == 0 ? 0 : count(rng);
        total += n;
      }
    }

    double gain = SecureInformationGain::informationGain(counts, total);
    EXPECT_GE(gain, 0.0) << "trial " << trial;
    EXPECT_LE(gain, std::log2(static_cast<double>(classes)) + 1e-9)
        << "trial " << trial;

    double ratio = SecureInformationGain::gainRatio(gain, counts, total);
    EXPECT_GE(ratio, 0.0) << "trial " << trial;
    EXPECT_FALSE(std::isnan(ratio)) << "trial " << trial;
  }
}

TEST(InformationGainTest, SingleObservedValueAlwaysHasZeroRatio) {
  std::mt19937 rng(11);
  for (int trial = 0; trial < 100; ++trial) {
    int values = 2 + static_cast<int>(rng() % 4);
    int classes = 2 + static_cast<int>(rng() % 3);
    CountMatrix counts(values, std::vector<uint64_t>(classes, 0));
    auto &observed = counts[rng() % values];
    uint64_t total = 0;
    for (auto &n : observed) {
      n = 1 + rng() % 20;
      total += n;
    }

    double gain = SecureInformationGain::informationGain(counts, total);
    EXPECT_EQ(SecureInformationGain::gainRatio(gain, counts, total), 0.0)
        << "trial " << trial;
  }
}

TEST(InformationGainTest, SingleValueAttributeHasZeroRatio) {
  CountMatrix counts = {{3, 5}, {0, 0}};
  double gain = SecureInformationGain::informationGain(counts, 8);
  EXPECT_NEAR(gain, 0.0, 1e-12);
  EXPECT_LT(SecureInformationGain::splitInformation(counts, 8),
            SecureInformationGain::kMinSplitInformation);
  EXPECT_EQ(SecureInformationGain::gainRatio(0.5, counts, 8), 0.0);
}

TEST(InformationGainTest, EmptyNodeScoresZero) {
  CountMatrix counts = {{0, 0}, {0, 0}};
  EXPECT_EQ(SecureInformationGain::informationGain(counts, 0), 0.0);
  EXPECT_EQ(SecureInformationGain::splitInformation(counts, 0), 0.0);
  EXPECT_EQ(SecureInformationGain::gainRatio(0.0, counts, 0), 0.0);
}

TEST(InformationGainTest, LocalCountsSkipMissingAndOutOfRange) {
  auto counts = SecureInformationGain::localCounts({0, 1, -1, 1, 5},
                                                   {1, 0, 1, -1, 0}, 2, 2);
  ASSERT_TRUE(counts.isSuccess());
  EXPECT_EQ(counts.value(), (CountMatrix{{0, 1}, {1, 0}}));
}

TEST(InformationGainTest, LocalCountsRejectMismatchedColumns) {
  auto counts = SecureInformationGain::localCounts({0, 1}, {1}, 2, 2);
  ASSERT_TRUE(counts.isError());
  EXPECT_EQ(counts.error(), ErrorCode::DataSchemaMismatch);

  auto empty = SecureInformationGain::localCounts({0}, {0}, 0, 2);
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ(empty.error(), ErrorCode::DataSchemaMismatch);
}

TEST(InformationGainTest, UnflattenChecksTheShape) {
  auto bad = SecureInformationGain::unflatten({1, 2, 3}, 2, 2);
  ASSERT_TRUE(bad.isError());
  EXPECT_EQ(bad.error(), ErrorCode::DataSchemaMismatch);

  auto good = SecureInformationGain::unflatten({1, 2, 3, 4}, 2, 2);
  ASSERT_TRUE(good.isSuccess());
  EXPECT_EQ(good.value(), (CountMatrix{{1, 2}, {3, 4}}));
}

TEST(InformationGainTest, CountMatrixIsSummedAroundTheRing) {
  SecureSum sa("A", 3), sb("B", 3), sc("C", 3);
  SecureInformationGain initiator(sa), second(sb), third(sc);

  CountMatrix zeros = {{0, 0}, {0, 0}};
  CountMatrix local = {{1, 2}, {3, 0}};
  auto state = initiator.initiateCounts(zeros);
  ASSERT_TRUE(state.isSuccess());
  state = second.participateCounts(state.value(), local);
  ASSERT_TRUE(state.isSuccess());
  state = third.participateCounts(state.value(), zeros);
  ASSERT_TRUE(state.isSuccess());

  auto global = initiator.finalizeCounts(state.value(), 2, 2);
  ASSERT_TRUE(global.isSuccess());
  EXPECT_EQ(global.value(), local);
}
