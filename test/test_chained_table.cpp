#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include "gtest/gtest.h"
#include "hwc/chained_table.hpp"
#include "randhash/random_utils.hpp"

namespace randhash {
namespace {

TEST(ChainedTableTest, UnitValuesOverDenseKeys) {
  RandomSource rng(1);
  ChainedTable<uint64_t> table(65536, rng);
  for (uint64_t key = 0; key < 65536; ++key) table.Insert(key, 1);

  EXPECT_EQ(table.Norm(), 65536);
  EXPECT_EQ(table.Query(42), 1);
  EXPECT_EQ(table.Query(65536), std::nullopt);
  EXPECT_EQ(table.Size(), 65536u);
  EXPECT_DOUBLE_EQ(table.LoadFactor(), 1.0);
}

TEST(ChainedTableTest, ExactNormOfPeriodicStream) {
  RandomSource rng(2);
  ChainedTable<uint64_t> table(8, rng);
  for (uint64_t i = 0; i < 1000000; ++i) table.Insert(i % 8, 1);

  EXPECT_EQ(table.Norm(), Value{125000000000});
  for (uint64_t key = 0; key < 8; ++key) EXPECT_EQ(table.Query(key), 125000);
  EXPECT_EQ(table.Size(), 8u);
}

TEST(ChainedTableTest, AggregatesRandomUpdates) {
  RandomSource rng(3);
  ChainedTable<uint64_t> table(1024, rng);
  std::unordered_map<uint64_t, Value> expected;
  for (int i = 0; i < 100000; ++i) {
    const uint64_t key = rng.Uniform(0, 5000);
    const auto delta = static_cast<Value>(rng.Uniform(0, 201)) - 100;
    table.Insert(key, delta);
    expected[key] += delta;
  }

  Value norm = 0;
  for (const auto& [key, value] : expected) {
    EXPECT_EQ(table.Query(key), value);
    norm += value * value;
  }
  EXPECT_EQ(table.Norm(), norm);
  EXPECT_EQ(table.Size(), expected.size());
  EXPECT_EQ(table.Query(5000), std::nullopt);
}

TEST(ChainedTableTest, CancelledKeyStaysPresent) {
  RandomSource rng(4);
  ChainedTable<uint64_t> table(16, rng);
  table.Insert(7, 5);
  table.Insert(7, -5);
  EXPECT_EQ(table.Query(7), 0);
  EXPECT_TRUE(table.Contains(7));
  EXPECT_FALSE(table.Contains(8));
  EXPECT_EQ(table.Norm(), 0);
  EXPECT_EQ(table.Size(), 1u);
}

TEST(ChainedTableTest, QueryDoesNotMutate) {
  RandomSource rng(5);
  ChainedTable<uint64_t> table(64, rng);
  for (uint64_t key = 0; key < 500; ++key) table.Insert(key * 31, key);
  const Value norm = table.Norm();
  const size_t size = table.Size();
  const size_t longest = table.LongestChain();

  for (int round = 0; round < 3; ++round) {
    for (uint64_t key = 0; key < 1000; ++key) {
      ASSERT_EQ(table.Query(key * 31), table.Query(key * 31));
    }
  }
  EXPECT_EQ(table.Norm(), norm);
  EXPECT_EQ(table.Size(), size);
  EXPECT_EQ(table.LongestChain(), longest);
}

TEST(ChainedTableTest, RepeatedInsertKeepsOneEntry) {
  RandomSource rng(6);
  ChainedTable<uint64_t> table(2, rng);
  for (int i = 0; i < 100; ++i) table.Insert(3, 2);
  EXPECT_EQ(table.Size(), 1u);
  EXPECT_EQ(table.LongestChain(), 1u);
  EXPECT_EQ(table.Query(3), 200);
}

TEST(ChainedTableTest, LongestChainBounds) {
  RandomSource rng(7);
  ChainedTable<uint64_t> table(16, rng);
  EXPECT_EQ(table.LongestChain(), 0u);
  for (uint64_t key = 0; key < 1000; ++key) table.Insert(key, 1);
  // Pigeonhole: some bucket holds at least 1000 / 16 keys.
  EXPECT_GE(table.LongestChain(), 63u);
  EXPECT_LE(table.LongestChain(), 1000u);
}

TEST(ChainedTableTest, ThirtyTwoBitKeys) {
  RandomSource rng(8);
  ChainedTable<uint32_t> table(256, rng);
  table.Insert(0, 1);
  table.Insert(0xFFFFFFFFu, 2);
  table.Insert(0xFFFFFFFFu, 2);
  EXPECT_EQ(table.Query(0), 1);
  EXPECT_EQ(table.Query(0xFFFFFFFFu), 4);
  EXPECT_EQ(table.Norm(), 17);
}

TEST(ChainedTableTest, BucketCountMustBePowerOfTwo) {
  RandomSource rng(9);
  EXPECT_THROW(ChainedTable<uint64_t>(0, rng), std::invalid_argument);
  EXPECT_THROW(ChainedTable<uint64_t>(1, rng), std::invalid_argument);
  EXPECT_THROW(ChainedTable<uint64_t>(3, rng), std::invalid_argument);
  EXPECT_THROW(ChainedTable<uint64_t>(1000, rng), std::invalid_argument);
  EXPECT_NO_THROW(ChainedTable<uint64_t>(2, rng));
  EXPECT_EQ(ChainedTable<uint64_t>(1024, rng).hash().l(), 10u);
  EXPECT_EQ(ChainedTable<uint64_t>(1024, rng).NumBuckets(), 1024u);
}

TEST(ChainedTableTest, DefaultSource) {
  ChainedTable<uint64_t> table(32);
  table.Insert(1, 1);
  EXPECT_EQ(table.Query(1), 1);
}

}  // namespace
}  // namespace randhash
