#include <gtest/gtest.h>

#include <string>

#include "core/random/RandomSource.h"
#include "core/text/Utf8.h"
#include "core/text/WordScrambler.h"

namespace {

std::string scrambleText(const std::string& word, const RandomSource& draw, bool preserveCase = true) {
  return encodeUtf8(scrambleWord(decodeUtf8(word), draw, preserveCase));
}

RandomSource zeroSource() {
  return []() { return 0.0; };
}

}  // namespace

TEST(WordScramblerTest, ShortWordsAreReturnedWithoutDrawing) {
  int calls = 0;
  RandomSource counting = [&calls]() {
    ++calls;
    return 0.0;
  };
  for (const std::string word : {"", "a", "ab", "abc", "ΠΡΟ"}) {
    EXPECT_EQ(scrambleText(word, counting), word);
  }
  EXPECT_EQ(calls, 0);
}

TEST(WordScramblerTest, KeepsFirstAndLastLetter) {
  auto draw = makeRandomSource(42, {});
  const std::string out = scrambleText("supercalifragilisticexpialidocious", draw);
  EXPECT_EQ(out, "sagslpieiucrloporxcfciedliiaaiitus");
  EXPECT_EQ(out.front(), 's');
  EXPECT_EQ(out.back(), 's');
}

TEST(WordScramblerTest, MatchesSeededReference) {
  auto draw = makeRandomSource(42, {});
  EXPECT_EQ(scrambleText("hello", draw), "hlleo");
}

TEST(WordScramblerTest, CaseFollowsPositionWhenPreserved) {
  // 内部 "Bc" 转小写后洗牌为 "cb"，第 0 位原为大写
  EXPECT_EQ(scrambleText("aBcd", zeroSource()), "aCbd");
  EXPECT_EQ(scrambleText("ABCD", zeroSource()), "ACBD");
}

TEST(WordScramblerTest, CaseTravelsWithLetterWhenNotPreserved) {
  EXPECT_EQ(scrambleText("aBcd", zeroSource(), false), "acBd");
}

TEST(WordScramblerTest, MixedCaseSeededReference) {
  auto preserved = makeRandomSource(7, {});
  EXPECT_EQ(scrambleText("ScRaMbLe", preserved), "SaMlRbCe");
  auto raw = makeRandomSource(7, {});
  EXPECT_EQ(scrambleText("ScRaMbLe", raw, false), "SaMLRbce");
}

TEST(WordScramblerTest, CaselessSlotsUpperCaseWhateverLandsThere) {
  // 内部 "on'" 转小写后洗牌为 "n'o"，第 2 位原为撇号
  EXPECT_EQ(scrambleText("don't", zeroSource()), "dn'Ot");
  auto draw = makeRandomSource(1, {});
  EXPECT_EQ(scrambleText("ab1cd", draw), "a1Cbd");
  auto hyphenated = makeRandomSource(4, {});
  EXPECT_EQ(scrambleText("it's-over", hyphenated), "is'oVe-tr");
}

TEST(WordScramblerTest, HandlesAstralLetters) {
  // 𝒜 与 𝒵 为 BMP 之外的字母，必须整体保留在首尾
  const std::string word = "\xF0\x9D\x92\x9C" "bcd" "\xF0\x9D\x92\xB5";
  const auto out = scrambleWord(decodeUtf8(word), zeroSource(), true);
  ASSERT_EQ(out.size(), 5u);
  EXPECT_EQ(out.front(), 0x1D49C);
  EXPECT_EQ(out.back(), 0x1D4B5);
  EXPECT_EQ(encodeUtf8(out), "\xF0\x9D\x92\x9C" "cdb" "\xF0\x9D\x92\xB5");
}
