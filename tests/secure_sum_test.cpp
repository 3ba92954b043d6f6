#include "mpc/secure_sum.hpp"
#include <array>
#include <cstdlib>
#include <gtest/gtest.h>
#include <memory>
#include <random>

using vertree::ErrorCode;

TEST(SecureSumTest, ThreePartyRingRevealsOnlyTheTotal) {
  SecureSum a("A", 3), b("B", 3), c("C", 3);

  auto s1 = a.initiate(5);
  ASSERT_TRUE(s1.isSuccess());
  EXPECT_EQ(s1.value().round, 1);
  auto s2 = b.participate(s1.value(), 7);
  ASSERT_TRUE(s2.isSuccess());
  auto s3 = c.participate(s2.value(), 11);
  ASSERT_TRUE(s3.isSuccess());
  EXPECT_EQ(s3.value().round, 3);

  auto total = a.finalize(s3.value());
  ASSERT_TRUE(total.isSuccess());
  EXPECT_EQ(total.value(), 23u);
  EXPECT_EQ(a.pendingSums(), 0u);
}

TEST(SecureSumTest, ArraySumAddsSlotwiseAcrossWraparound) {
  SecureSum a("A", 4), b("B", 4), c("C", 4), d("D", 4);
  const uint64_t big = UINT64_MAX - 1;

  auto s = a.initiateArray({big, 0, 3});
  ASSERT_TRUE(s.isSuccess());
  s = b.participateArray(s.value(), {1, 2, 0});
  ASSERT_TRUE(s.isSuccess());
  s = c.participateArray(s.value(), {0, 2, 0});
  ASSERT_TRUE(s.isSuccess());
  s = d.participateArray(s.value(), {0, 0, 4});
  ASSERT_TRUE(s.isSuccess());

  auto sums = a.finalizeArray(s.value());
  ASSERT_TRUE(sums.isSuccess());
  EXPECT_EQ(sums.value(), (std::vector<uint64_t>{UINT64_MAX, 4, 7}));
}

TEST(SecureSumTest, PartialSumsAreMasked) {
  SecureSum a("A", 3);
  auto first = a.initiate(42);
  auto second = a.initiate(42);
  ASSERT_TRUE(first.isSuccess());
  ASSERT_TRUE(second.isSuccess());

  // Probability of a collision with a uniform 64-bit mask is negligible
  EXPECT_NE(first.value().partial_sums[0], 42u);
  EXPECT_NE(first.value().partial_sums[0], second.value().partial_sums[0]);
  EXPECT_NE(first.value().sum_id, second.value().sum_id);
  EXPECT_EQ(a.pendingSums(), 2u);
}

TEST(SecureSumTest, RingOfAnySizeRevealsTheTotal) {
  std::mt19937_64 rng(20261018);
  for (int n = 2; n <= 6; ++n) {
    std::vector<std::unique_ptr<SecureSum>> ring;
    for (int i = 0; i < n; ++i) {
      ring.push_back(std::make_unique<SecureSum>("P" + std::to_string(i), n,
                                                 n == 2));
    }
    for (int trial = 0; trial < 50; ++trial) {
      std::vector<uint64_t> values;
      uint64_t expected = 0;
      for (int i = 0; i < n; ++i) {
        // Large draws exercise the modulo 2^64 wraparound
        values.push_back(trial % 2 == 0 ? rng() % 1000 : rng());
        expected += values.back();
      }

      auto state = ring[0]->initiate(values[0]);
      ASSERT_TRUE(state.isSuccess()) << "n=" << n;
      for (int i = 1; i < n; ++i) {
        state = ring[i]->participate(state.value(), values[i]);
        ASSERT_TRUE(state.isSuccess()) << "n=" << n << " member " << i;
      }
      auto total = ring[0]->finalize(state.value());
      ASSERT_TRUE(total.isSuccess()) << "n=" << n;
      EXPECT_EQ(total.value(), expected) << "n=" << n;
    }
    EXPECT_EQ(ring[0]->pendingSums(), 0u);
  }
}

TEST(SecureSumTest, MaskedPartialSumDoesNotDependOnTheInitiatorValue) {
  constexpr int kSamples = 4000;
  constexpr int kBuckets = 16;
  const std::array<uint64_t, 2> secrets = {0, (1ULL << 63) + 12345};

  // Histograms of the high and low nibble of what the second member sees
  std::array<std::array<int, kBuckets>, 2> high{};
  std::array<std::array<int, kBuckets>, 2> low{};
  SecureSum initiator("A", 3);
  for (size_t s = 0; s < secrets.size(); ++s) {
    for (int i = 0; i < kSamples; ++i) {
      auto state = initiator.initiate(secrets[s]);
      ASSERT_TRUE(state.isSuccess());
      uint64_t seen = state.value().partial_sums[0];
      high[s][seen >> 60]++;
      low[s][seen & 0xF]++;
      initiator.abandon(state.value().sum_id);
    }
  }
  EXPECT_EQ(initiator.pendingSums(), 0u);

  // 250 expected per bucket with a standard deviation near 15
  for (int b = 0; b < kBuckets; ++b) {
    for (size_t s = 0; s < secrets.size(); ++s) {
      EXPECT_GT(high[s][b], 150) << "bucket " << b;
      EXPECT_LT(high[s][b], 350) << "bucket " << b;
      EXPECT_GT(low[s][b], 150) << "bucket " << b;
      EXPECT_LT(low[s][b], 350) << "bucket " << b;
    }
    EXPECT_LT(std::abs(high[0][b] - high[1][b]), 130) << "bucket " << b;
    EXPECT_LT(std::abs(low[0][b] - low[1][b]), 130) << "bucket " << b;
  }
}

TEST(SecureSumTest, TwoPartyRingIsRefusedUnlessAllowed) {
  SecureSum strict("A", 2);
  auto refused = strict.initiate(1);
  ASSERT_TRUE(refused.isError());
  EXPECT_EQ(refused.error(), ErrorCode::MPCInsufficientParticipants);
  EXPECT_FALSE(strict.providesPrivacy());

  SecureSum relaxed("A", 2, true), other("B", 2, true);
  auto s = relaxed.initiate(3);
  ASSERT_TRUE(s.isSuccess());
  s = other.participate(s.value(), 4);
  ASSERT_TRUE(s.isSuccess());
  auto total = relaxed.finalize(s.value());
  ASSERT_TRUE(total.isSuccess());
  EXPECT_EQ(total.value(), 7u);
}

TEST(SecureSumTest, SingleMemberRingIsRefused) {
  SecureSum alone("A", 1, true);
  auto result = alone.initiate(1);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error(), ErrorCode::MPCInsufficientParticipants);
}

TEST(SecureSumTest, OnlyTheInitiatorCanFinalize) {
  SecureSum a("A", 3), b("B", 3), c("C", 3);
  auto s = a.initiate(1);
  ASSERT_TRUE(s.isSuccess());
  s = b.participate(s.value(), 1);
  s = c.participate(s.value(), 1);
  ASSERT_TRUE(s.isSuccess());

  auto stolen = b.finalize(s.value());
  ASSERT_TRUE(stolen.isError());
  EXPECT_EQ(stolen.error(), ErrorCode::ProtocolStateError);
}

TEST(SecureSumTest, EarlyFinalizeIsAStateError) {
  SecureSum a("A", 3), b("B", 3);
  auto s = a.initiate(1);
  s = b.participate(s.value(), 2);
  ASSERT_TRUE(s.isSuccess());

  auto early = a.finalize(s.value());
  ASSERT_TRUE(early.isError());
  EXPECT_EQ(early.error(), ErrorCode::ProtocolStateError);
}

TEST(SecureSumTest, FinalizeTwiceFails) {
  SecureSum a("A", 3), b("B", 3), c("C", 3);
  auto s = a.initiate(1);
  s = b.participate(s.value(), 1);
  s = c.participate(s.value(), 1);
  ASSERT_TRUE(a.finalize(s.value()).isSuccess());

  auto again = a.finalize(s.value());
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error(), ErrorCode::ProtocolStateError);
}

TEST(SecureSumTest, ParticipationAfterTheRingClosedIsASequenceError) {
  SecureSum a("A", 3), b("B", 3), c("C", 3);
  auto s = a.initiate(1);
  s = b.participate(s.value(), 1);
  s = c.participate(s.value(), 1);
  ASSERT_TRUE(s.isSuccess());

  auto extra = b.participate(s.value(), 1);
  ASSERT_TRUE(extra.isError());
  EXPECT_EQ(extra.error(), ErrorCode::ProtocolSequenceError);
}

TEST(SecureSumTest, SlotCountMismatchIsRejected) {
  SecureSum a("A", 3), b("B", 3);
  auto s = a.initiateArray({1, 2});
  ASSERT_TRUE(s.isSuccess());

  auto wrong = b.participateArray(s.value(), {1});
  ASSERT_TRUE(wrong.isError());
  EXPECT_EQ(wrong.error(), ErrorCode::DataSchemaMismatch);

  auto scalar = b.participate(s.value(), 1);
  ASSERT_TRUE(scalar.isError());
  EXPECT_EQ(scalar.error(), ErrorCode::ProtocolStateError);
}

TEST(SecureSumTest, AbandonDropsTheMask) {
  SecureSum a("A", 3), b("B", 3), c("C", 3);
  auto s = a.initiate(9);
  ASSERT_TRUE(s.isSuccess());
  a.abandon(s.value().sum_id);
  EXPECT_EQ(a.pendingSums(), 0u);

  s = b.participate(s.value(), 1);
  s = c.participate(s.value(), 1);
  auto total = a.finalize(s.value());
  ASSERT_TRUE(total.isError());
  EXPECT_EQ(total.error(), ErrorCode::ProtocolStateError);
}
