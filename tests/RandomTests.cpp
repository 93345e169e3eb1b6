#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "core/random/RandomSource.h"
#include "core/random/SeededRandom.h"
#include "core/random/Shuffle.h"

namespace {

RandomSource constantSource(double value) {
  return [value]() { return value; };
}

}  // namespace

TEST(SeededRandomTest, MatchesMinimalStandardReferenceSequence) {
  SeededRandom rng(42);
  EXPECT_DOUBLE_EQ(rng.next(), 0.00032870704338765428);
  EXPECT_DOUBLE_EQ(rng.next(), 0.52458710179160084);
  EXPECT_DOUBLE_EQ(rng.next(), 0.73542353206819255);
  EXPECT_DOUBLE_EQ(rng.next(), 0.26330554044181997);
  EXPECT_DOUBLE_EQ(rng.next(), 0.37622397102063893);
  EXPECT_EQ(rng.state(), 807934826);
}

TEST(SeededRandomTest, FirstStepFromSeedOneIsMultiplier) {
  SeededRandom rng(1);
  rng.next();
  EXPECT_EQ(rng.state(), SeededRandom::kMultiplier);
}

TEST(SeededRandomTest, NormalizesNonPositiveSeeds) {
  EXPECT_EQ(SeededRandom(0).state(), 2147483646);
  EXPECT_EQ(SeededRandom(-5).state(), 2147483641);
  EXPECT_EQ(SeededRandom(SeededRandom::kModulus).state(), 2147483646);
  EXPECT_EQ(SeededRandom(SeededRandom::kModulus + 7).state(), 7);
  // 1 - M 归一化后为 0，需要落回 [1, M-1]
  EXPECT_EQ(SeededRandom(1 - SeededRandom::kModulus).state(), SeededRandom::kModulus - 1);
}

TEST(SeededRandomTest, StaysWithinUnitInterval) {
  for (std::int64_t seed : {std::int64_t{1}, std::int64_t{42}, std::int64_t{-1}, 1 - SeededRandom::kModulus,
                            std::int64_t{9007199254740991}}) {
    SeededRandom rng(seed);
    for (int i = 0; i < 1000; ++i) {
      const double value = rng.next();
      ASSERT_GE(value, 0.0) << "seed " << seed;
      ASSERT_LT(value, 1.0) << "seed " << seed;
    }
  }
}

TEST(SeededRandomTest, SameSeedSameSequence) {
  SeededRandom a(123456789);
  SeededRandom b(123456789);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(a.next(), b.next());
  }
}

TEST(RandomSourceTest, SeededSourcesAreIndependent) {
  auto first = makeRandomSource(42, {});
  first();
  first();
  auto second = makeRandomSource(42, {});
  EXPECT_DOUBLE_EQ(second(), 0.00032870704338765428);
}

TEST(RandomSourceTest, UsesAmbientFactoryOnlyWithoutSeed) {
  int created = 0;
  AmbientSourceFactory factory = [&created]() {
    ++created;
    return constantSource(0.25);
  };
  auto seeded = makeRandomSource(7, factory);
  EXPECT_EQ(created, 0);
  auto ambient = makeRandomSource(std::nullopt, factory);
  EXPECT_EQ(created, 1);
  EXPECT_DOUBLE_EQ(ambient(), 0.25);
}

TEST(RandomSourceTest, DefaultAmbientSourceProducesUnitInterval) {
  auto source = makeRandomSource(std::nullopt, {});
  for (int i = 0; i < 1000; ++i) {
    const double value = source();
    ASSERT_GE(value, 0.0);
    ASSERT_LT(value, 1.0);
  }
}

TEST(ShuffleTest, EmptyAndSingleElementAreCopied) {
  int calls = 0;
  RandomSource counting = [&calls]() {
    ++calls;
    return 0.5;
  };
  EXPECT_TRUE(shuffled(std::vector<int>{}, counting).empty());
  EXPECT_EQ(shuffled(std::vector<int>{7}, counting), std::vector<int>{7});
  EXPECT_EQ(calls, 0);
}

TEST(ShuffleTest, SwapsWithDrawnIndexFromTheBack) {
  const std::vector<char> input{'a', 'b', 'c', 'd'};
  // j 恒为 0：依次交换 3<->0, 2<->0, 1<->0
  EXPECT_EQ(shuffled(input, constantSource(0.0)), (std::vector<char>{'b', 'c', 'd', 'a'}));
  // j 恒为 i：不发生交换
  EXPECT_EQ(shuffled(input, constantSource(0.999999)), input);
}

TEST(ShuffleTest, DrawsOncePerPositionAndLeavesInputUntouched) {
  const std::vector<int> input{1, 2, 3, 4, 5, 6};
  int calls = 0;
  auto rng = makeRandomSource(42, {});
  RandomSource counting = [&]() {
    ++calls;
    return rng();
  };
  auto out = shuffled(input, counting);
  EXPECT_EQ(calls, 5);
  EXPECT_EQ(input, (std::vector<int>{1, 2, 3, 4, 5, 6}));
  std::sort(out.begin(), out.end());
  EXPECT_EQ(out, input);
}

TEST(ShuffleTest, ClampsOutOfRangeDraws) {
  const std::vector<int> input{1, 2, 3};
  EXPECT_EQ(shuffled(input, constantSource(1.5)), input);
  EXPECT_EQ(shuffled(input, constantSource(-0.3)), shuffled(input, constantSource(0.0)));
}
