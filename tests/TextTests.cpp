#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/text/Segment.h"
#include "core/text/Tokenizer.h"
#include "core/text/Utf8.h"

namespace {

std::string str(const CodePoints& units) {
  return encodeUtf8(units);
}

std::vector<std::string> tokenTexts(const std::vector<TextToken>& tokens) {
  std::vector<std::string> out;
  for (const auto& token : tokens) {
    out.push_back(str(token.text));
  }
  return out;
}

}  // namespace

TEST(Utf8Test, DecodesCodePointsNotBytes) {
  EXPECT_EQ(decodeUtf8("hello").size(), 5u);
  EXPECT_EQ(decodeUtf8("héllo").size(), 5u);
  EXPECT_EQ(decodeUtf8("ΠΡΟΣΟΧΗ").size(), 7u);

  const auto emoji = decodeUtf8("a\xF0\x9F\x91\x8B" "b");
  ASSERT_EQ(emoji.size(), 3u);
  EXPECT_EQ(emoji[1], 0x1F44B);
}

TEST(Utf8Test, RoundTripsWellFormedText) {
  for (const std::string text : {"", "plain ascii", "naïve café", "привет мир", "漢字かな", "\xF0\x9D\x92\x9C"}) {
    EXPECT_EQ(encodeUtf8(decodeUtf8(text)), text);
  }
}

TEST(Utf8Test, PreservesIllFormedBytes) {
  const std::string broken = "ab\xFF\xFE" "cd";
  const auto units = decodeUtf8(broken);
  ASSERT_EQ(units.size(), 6u);
  EXPECT_TRUE(isRawByte(units[2]));
  EXPECT_TRUE(isRawByte(units[3]));
  EXPECT_EQ(encodeUtf8(units), broken);

  const std::string truncated = "x\xE2\x82";
  const auto tail = decodeUtf8(truncated);
  ASSERT_EQ(tail.size(), 3u);
  EXPECT_TRUE(isRawByte(tail[1]));
  EXPECT_TRUE(isRawByte(tail[2]));
  EXPECT_EQ(encodeUtf8(tail), truncated);

  // 代理区码点的 UTF-8 形式是非法的
  const std::string surrogate = "\xED\xA0\x80";
  EXPECT_EQ(encodeUtf8(decodeUtf8(surrogate)), surrogate);
}

TEST(Utf8Test, ClassifiesLetters) {
  EXPECT_TRUE(isLetter('a'));
  EXPECT_TRUE(isLetter('Z'));
  EXPECT_TRUE(isLetter(0x00E9));  // é
  EXPECT_TRUE(isLetter(0x03A0));  // Π
  EXPECT_TRUE(isLetter(0x6F22));  // 漢
  EXPECT_TRUE(isLetter(0x1D49C)); // 𝒜
  EXPECT_FALSE(isLetter('1'));
  EXPECT_FALSE(isLetter('\''));
  EXPECT_FALSE(isLetter('-'));
  EXPECT_FALSE(isLetter(0x1F44B));
  EXPECT_FALSE(isLetter(decodeUtf8("\xFF").front()));
}

TEST(Utf8Test, ClassifiesWhitespace) {
  for (CodePoint c : {0x20, 0x09, 0x0A, 0x0D, 0x0B, 0x0C, 0xA0, 0x1680, 0x2003, 0x2028, 0x2029, 0x202F, 0x3000, 0xFEFF}) {
    EXPECT_TRUE(isWhitespace(c)) << std::hex << c;
  }
  EXPECT_FALSE(isWhitespace('a'));
  EXPECT_FALSE(isWhitespace(0x200B));
  EXPECT_FALSE(isWhitespace(decodeUtf8("\xFF").front()));
}

TEST(Utf8Test, MapsCaseOneToOne) {
  EXPECT_TRUE(isUpperCase('A'));
  EXPECT_FALSE(isUpperCase('a'));
  EXPECT_TRUE(isUpperCase(0x03A3)); // Σ
  EXPECT_EQ(toLowerCase(0x03A3), 0x03C3);
  EXPECT_EQ(toUpperCase(0x00E9), 0x00C9);
  EXPECT_EQ(toUpperCase('1'), '1');
  const CodePoint raw = decodeUtf8("\xFF").front();
  EXPECT_EQ(toLowerCase(raw), raw);
  EXPECT_EQ(toUpperCase(raw), raw);
}

TEST(Utf8Test, CaselessCharactersCountAsUpperCase) {
  for (CodePoint c : {0x27, 0x31, 0x2D, 0x1F44B, 0x6F22}) { // ' 1 - 👋 漢
    EXPECT_TRUE(isUpperCase(c)) << std::hex << c;
  }
  EXPECT_TRUE(isUpperCase(decodeUtf8("\xFF").front()));
  // 完整大写映射会改变长度的字符不算大写
  EXPECT_FALSE(isUpperCase(0x00DF)); // ß
  EXPECT_FALSE(isUpperCase(0xFB01)); // ﬁ
}

TEST(SegmentTest, SplitsSurroundingPunctuation) {
  auto segments = classifySegments(decodeUtf8("(hello),"));
  EXPECT_EQ(str(segments.prefix), "(");
  EXPECT_EQ(str(segments.core), "hello");
  EXPECT_EQ(str(segments.suffix), "),");

  segments = classifySegments(decodeUtf8("hello123"));
  EXPECT_EQ(str(segments.prefix), "");
  EXPECT_EQ(str(segments.core), "hello");
  EXPECT_EQ(str(segments.suffix), "123");
}

TEST(SegmentTest, KeepsInnerPunctuationInCore) {
  auto segments = classifySegments(decodeUtf8("\"don't\""));
  EXPECT_EQ(str(segments.prefix), "\"");
  EXPECT_EQ(str(segments.core), "don't");
  EXPECT_EQ(str(segments.suffix), "\"");

  segments = classifySegments(decodeUtf8("well-known"));
  EXPECT_EQ(str(segments.core), "well-known");
}

TEST(SegmentTest, TokenWithoutLettersIsAllPrefix) {
  for (const std::string text : {"123", "--", "\xF0\x9F\x91\x8B", "\xFF\xFE"}) {
    const auto segments = classifySegments(decodeUtf8(text));
    EXPECT_EQ(str(segments.prefix), text);
    EXPECT_TRUE(segments.core.empty());
    EXPECT_TRUE(segments.suffix.empty());
  }
}

TEST(SegmentTest, PartsConcatenateToToken) {
  for (const std::string text : {"a", "...wow!!!", "«Привет»", "x1y", "¿qué?"}) {
    const auto segments = classifySegments(decodeUtf8(text));
    EXPECT_EQ(str(segments.prefix) + str(segments.core) + str(segments.suffix), text);
  }
}

TEST(TokenizerTest, AlternatesWhitespaceAndContent) {
  const auto tokens = splitWhitespaceRuns(decodeUtf8("hello   world\tagain"));
  EXPECT_EQ(tokenTexts(tokens), (std::vector<std::string>{"hello", "   ", "world", "\t", "again"}));
  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_FALSE(tokens[0].whitespace);
  EXPECT_TRUE(tokens[1].whitespace);
  EXPECT_FALSE(tokens[2].whitespace);
}

TEST(TokenizerTest, KeepsLeadingAndTrailingWhitespace) {
  const auto tokens = splitWhitespaceRuns(decodeUtf8(" \n word  "));
  EXPECT_EQ(tokenTexts(tokens), (std::vector<std::string>{" \n ", "word", "  "}));
  EXPECT_TRUE(tokens.front().whitespace);
  EXPECT_TRUE(tokens.back().whitespace);
}

TEST(TokenizerTest, EmptyTextHasNoTokens) {
  EXPECT_TRUE(splitWhitespaceRuns({}).empty());
}

TEST(TokenizerTest, WhitespaceOnlyTextIsOneToken) {
  const auto tokens = splitWhitespaceRuns(decodeUtf8(" \t\r\n"));
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_TRUE(tokens[0].whitespace);
}
