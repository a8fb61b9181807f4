#include "dataset-validator/engine/UniqueTracker.hpp"

#include <gtest/gtest.h>

using namespace dsvalidator;
using namespace dsvalidator::engine;

TEST(UniqueTracker, ExactReportsRepeats) {
  ExactUniqueTracker tracker;
  // A, B, A, C, A -> two duplicates
  int duplicates = 0;
  for (const char *key : {"s:A", "s:B", "s:A", "s:C", "s:A"}) {
    if (tracker.check_and_insert(key))
      ++duplicates;
  }
  EXPECT_EQ(duplicates, 2);
  EXPECT_EQ(tracker.size(), 3u);
  EXPECT_GT(tracker.memory_bytes(), 0u);
}

TEST(UniqueTracker, BloomSizing) {
  BloomUniqueTracker tracker(1000, 0.01);
  // m = -n ln p / (ln 2)^2 ~ 9586 bits, k ~ 7
  EXPECT_GE(tracker.bit_count(), 9500u);
  EXPECT_LE(tracker.bit_count(), 9700u);
  EXPECT_EQ(tracker.hash_count(), 7u);
  EXPECT_GE(tracker.memory_bytes() * 8, tracker.bit_count());
}

TEST(UniqueTracker, BloomNeverMissesRepeats) {
  BloomUniqueTracker tracker(5000, 0.001);
  for (int i = 0; i < 2000; ++i)
    tracker.check_and_insert("i:" + std::to_string(i));
  for (int i = 0; i < 2000; ++i)
    EXPECT_TRUE(tracker.check_and_insert("i:" + std::to_string(i))) << i;
}

TEST(UniqueTracker, BloomFalsePositiveRateStaysLow) {
  BloomUniqueTracker tracker(10000, 0.01);
  for (int i = 0; i < 10000; ++i)
    tracker.check_and_insert("i:" + std::to_string(i));
  int false_positives = 0;
  for (int i = 10000; i < 11000; ++i) {
    if (tracker.check_and_insert("i:" + std::to_string(i)))
      ++false_positives;
  }
  // Roughly 1% of the probes; allow generous headroom
  EXPECT_LT(false_positives, 60);
}

TEST(UniqueTracker, FactoryFollowsConfig) {
  ValidatorConfig config;
  auto exact = make_unique_tracker(config);
  EXPECT_NE(dynamic_cast<ExactUniqueTracker *>(exact.get()), nullptr);

  config.uniqueness_strategy = UniquenessStrategy::Bloom;
  config.bloom_expected_items = 100;
  auto bloom = make_unique_tracker(config);
  EXPECT_NE(dynamic_cast<BloomUniqueTracker *>(bloom.get()), nullptr);
}
